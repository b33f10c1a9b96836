#pragma once

#include "lsbridge/config.hpp"
#include "lsbridge/environment.hpp"
#include "lsbridge/errors.hpp"
#include "lsbridge/events.hpp"
#include "lsbridge/format.hpp"
#include "lsbridge/mcp.hpp"
#include "lsbridge/multiplexer.hpp"
#include "lsbridge/process.hpp"
#include "lsbridge/project.hpp"
#include "lsbridge/protocol.hpp"
#include "lsbridge/registry.hpp"
#include "lsbridge/session.hpp"
#include "lsbridge/tools.hpp"
#include "lsbridge/transport.hpp"
#include "lsbridge/utils.hpp"

#pragma once

#include "config.hpp"
#include "tools.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace lsbridge::mcp {

    inline constexpr std::string_view protocol_version = "2024-11-05";

    // Handles one newline-delimited JSON-RPC message; returns the reply line, or empty for notifications.
    std::string handle_message(std::string_view line, tool_service& tools);

    // Serves until `in` reaches EOF.
    void serve(std::istream& in, std::ostream& out, tool_service& tools);

    // stdio server for the configured backend; shuts every session down at EOF.
    int run_mcp_server(const startup_config& cfg);

}  // namespace lsbridge::mcp

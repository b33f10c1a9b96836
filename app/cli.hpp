#pragma once

#include "lsbridge.hpp"

#include <optional>

namespace lsbridge::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    void run_repl(const startup_config& cfg);

}  // namespace lsbridge::cli

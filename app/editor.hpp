#pragma once

#include "lsbridge.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lsbridge::cli {

    // Line editing for the interactive repl: history and ':' command completion.
    class line_editor {
      public:
        explicit line_editor(const startup_config& cfg);

        std::optional<std::string> read_line(std::string_view prompt);
    };

}  // namespace lsbridge::cli

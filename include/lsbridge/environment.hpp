#pragma once

#include "config.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lsbridge {

    struct environment_report {
        bool available{false};
        std::optional<std::string> version{};
        std::string server_path{};
        std::string working_directory{};
        std::optional<std::string> project_type{};
        std::optional<std::string> project_root{};
        bool index_store_available{false};
        std::optional<std::string> index_store_path{};
        bool build_required{false};
        std::vector<std::string> recommendations{};

        // available and nothing left to recommend
        bool ready() const { return available && recommendations.empty(); }
    };

    inline constexpr std::chrono::milliseconds environment_check_timeout{5'000};

    // Human-readable project type for the marker that identified a root, e.g. "Swift Package Manager".
    std::string describe_project_type(std::string_view marker);

    /*
     * Looks for a prebuilt index store under root: SwiftPM's .build/<config>/index/store
     * (also below a triple directory) and Xcode's DerivedData/<project>/Index*.
     */
    std::optional<std::filesystem::path> find_index_store(const std::filesystem::path& root);

    // Runs the configured server with `--help` / `--version` and inspects directory for a project.
    // Never opens a session.
    environment_report check_environment(const startup_config& cfg, const std::filesystem::path& directory);

}  // namespace lsbridge

#include "lsbridge/environment.hpp"

#include "lsbridge/format.hpp"
#include "lsbridge/project.hpp"

#include "internal/subprocess.hpp"

using namespace lsbridge::literals;
namespace fs = std::filesystem;

namespace lsbridge {

    namespace detail {

        static std::optional<std::string> first_line(std::string_view text) {
            auto trimmed = utils::trim_view(text);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            auto nl = trimmed.find('\n');
            return std::string{utils::trim_view(trimmed.substr(0, nl))};
        }

        static bool is_index_dir(const fs::path& dir) {
            auto name = dir.filename().string();
            auto parent = dir.parent_path().filename().string();
            return (name == "store" && parent == "index") || name == "IndexStoreDB" || name == "DataStore";
        }

        static std::optional<fs::path> search_index(const fs::path& base, int max_depth) {
            std::error_code ec{};
            if (!fs::is_directory(base, ec)) {
                return std::nullopt;
            }
            fs::recursive_directory_iterator it{base, fs::directory_options::skip_permission_denied, ec};
            for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
                if (it.depth() > max_depth) {
                    it.disable_recursion_pending();
                    continue;
                }
                std::error_code entry_ec{};
                if (it->is_directory(entry_ec) && is_index_dir(it->path())) {
                    return it->path();
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::string describe_project_type(std::string_view marker) {
        if (marker == "Package.swift"sv) {
            return "Swift Package Manager";
        }
        if (marker.ends_with(".xcodeproj") || marker.ends_with(".xcworkspace")) {
            return "Xcode Project";
        }
        if (marker == "compile_commands.json"sv) {
            return "Compilation Database";
        }
        if (marker == "buildServer.json"sv) {
            return "Build Server";
        }
        return std::string{marker};
    }

    std::optional<fs::path> find_index_store(const fs::path& root) {
        for (auto config : {"debug", "release"}) {
            std::error_code ec{};
            auto direct = root / ".build" / config / "index" / "store";
            if (fs::is_directory(direct, ec)) {
                return direct;
            }
        }
        if (auto found = detail::search_index(root / ".build", 4)) {
            return found;
        }
        return detail::search_index(root / "DerivedData", 4);
    }

    environment_report check_environment(const startup_config& cfg, const fs::path& directory) {
        environment_report report{.server_path = cfg.server_path.string(), .working_directory = directory.string()};

        auto help = internal::run_subprocess({cfg.server_path.string(), "--help"}, environment_check_timeout);
        if (help.timed_out) {
            report.recommendations.push_back(
                    "{} --help did not finish within {}ms"_format(report.server_path, environment_check_timeout.count()));
        }
        else if (help.exit_code == 127) {
            report.recommendations.push_back(
                    "{} was not found; install it or point --server at the language server"_format(report.server_path));
        }
        else if (help.exit_code != 0) {
            report.recommendations.push_back(
                    "{} --help exited with code {}"_format(report.server_path, help.exit_code));
        }
        else {
            report.available = true;
            auto ver = internal::run_subprocess({cfg.server_path.string(), "--version"}, environment_check_timeout);
            if (!ver.timed_out && ver.exit_code == 0) {
                report.version = detail::first_line(ver.stdout_output);
            }
        }
        debug_log("checked ", report.server_path, ": available=", report.available);

        auto root = resolve_project_root(directory, cfg.root_markers);
        if (!root) {
            report.recommendations.push_back(
                    "no project marker ({}) found in {} or its parents"_format(
                            utils::join_with_separator(cfg.root_markers, ", "), report.working_directory));
            return report;
        }

        report.project_root = root->string();
        if (auto marker = find_root_marker(*root, cfg.root_markers)) {
            report.project_type = describe_project_type(*marker);
        }

        if (auto store = find_index_store(*root)) {
            report.index_store_available = true;
            report.index_store_path = store->string();
        }
        else if (report.project_type == "Swift Package Manager") {
            report.build_required = true;
            report.recommendations.push_back(
                    "Run 'swift build' to generate the index store needed for cross-file queries");
        }
        else if (report.project_type == "Xcode Project") {
            report.build_required = true;
            report.recommendations.push_back("Build the project in Xcode to generate the index store");
        }
        return report;
    }

}  // namespace lsbridge

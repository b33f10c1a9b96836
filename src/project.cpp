#include "lsbridge/project.hpp"

#include "lsbridge/utils.hpp"

namespace fs = std::filesystem;

namespace lsbridge {

    bool matches_root_marker(std::string_view entry_name, std::string_view marker) {
        if (marker.starts_with("*.")) {
            auto suffix = marker.substr(1);
            return entry_name.size() > suffix.size() && entry_name.ends_with(suffix);
        }
        return entry_name == marker;
    }

    std::optional<std::string> find_root_marker(const fs::path& dir, const std::vector<std::string>& markers) {
        std::error_code ec{};
        for (const auto& marker : markers) {
            if (!marker.starts_with("*.")) {
                if (fs::exists(dir / marker, ec)) {
                    return marker;
                }
                continue;
            }
            for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator{}; it.increment(ec)) {
                if (matches_root_marker(it->path().filename().string(), marker)) {
                    return it->path().filename().string();
                }
            }
            ec.clear();
        }
        return std::nullopt;
    }

    std::optional<fs::path> resolve_project_root(const fs::path& path, const std::vector<std::string>& markers) {
        std::error_code ec{};
        auto start = fs::weakly_canonical(fs::absolute(path, ec), ec);
        if (ec) {
            debug_log("cannot canonicalize ", path.string(), ": ", ec.message());
            return std::nullopt;
        }
        if (!fs::is_directory(start, ec)) {
            start = start.parent_path();
        }

        for (auto dir = start;; dir = dir.parent_path()) {
            if (auto marker = find_root_marker(dir, markers)) {
                debug_log("project root for ", path.string(), " is ", dir.string(), " (", *marker, ")");
                auto root = fs::canonical(dir, ec);
                return ec ? dir : root;
            }
            if (dir == dir.root_path() || dir.parent_path() == dir) {
                break;
            }
        }
        return std::nullopt;
    }

}  // namespace lsbridge

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsbridge {

    // Exact file name, or "*.ext" to match any entry with that suffix.
    bool matches_root_marker(std::string_view entry_name, std::string_view marker);

    /*
     * Walks from the directory containing `path` (or `path` itself when it is a directory)
     * towards the filesystem root; the first directory holding an entry that matches any
     * marker is returned, canonicalized. Returns nullopt when no ancestor qualifies.
     */
    std::optional<std::filesystem::path> resolve_project_root(
            const std::filesystem::path& path, const std::vector<std::string>& markers);

    // Name of the first marker found in dir, used to describe the project type.
    std::optional<std::string> find_root_marker(
            const std::filesystem::path& dir, const std::vector<std::string>& markers);

}  // namespace lsbridge

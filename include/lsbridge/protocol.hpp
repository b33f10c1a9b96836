#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsbridge {

    // Zero-based line, UTF-16 code unit offset within the line (LSP convention).
    struct position {
        uint32_t line{};
        uint32_t character{};

        bool operator==(const position&) const = default;
    };

    struct range {
        position start{};
        position end{};

        bool operator==(const range&) const = default;
    };

    struct location {
        std::string uri{};
        range span{};

        std::filesystem::path path() const;
    };

    struct hover_info {
        std::string contents{};
        std::optional<range> span{};
    };

    struct document_symbol {
        std::string name{};
        std::string detail{};
        int kind{};
        range span{};
        range selection{};
        std::vector<document_symbol> children{};
    };

    struct diagnostic {
        range span{};
        int severity{1};
        std::string message{};
        std::optional<std::string> source{};
    };

    struct edit_result {
        uint32_t start_line{};
        uint32_t end_line{};
        size_t lines_removed{};
        size_t lines_added{};
    };

    // file:// URI for an absolute path; reserved characters are percent-encoded.
    std::string path_to_uri(const std::filesystem::path& path);

    // Inverse of path_to_uri. Non-file URIs are returned unchanged as a path.
    std::filesystem::path uri_to_path(std::string_view uri);

    // languageId sent with textDocument/didOpen, derived from the extension.
    std::string_view language_id_for(const std::filesystem::path& path);

    std::string_view symbol_kind_name(int kind);

}  // namespace lsbridge

#include "lsbridge/protocol.hpp"

#include <array>
#include <cctype>

using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace lsbridge {

    namespace detail {

        static bool is_unreserved(unsigned char c) {
            return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
        }

        static int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

    }  // namespace detail

    fs::path location::path() const {
        return uri_to_path(uri);
    }

    std::string path_to_uri(const fs::path& path) {
        static constexpr auto hex = "0123456789ABCDEF"sv;
        auto text = path.generic_string();
        std::string out{"file://"};
        out.reserve(out.size() + text.size());
        for (char ch : text) {
            auto c = static_cast<unsigned char>(ch);
            if (detail::is_unreserved(c)) {
                out.push_back(ch);
            }
            else {
                out.push_back('%');
                out.push_back(hex[c >> 4U]);
                out.push_back(hex[c & 0x0FU]);
            }
        }
        return out;
    }

    fs::path uri_to_path(std::string_view uri) {
        static constexpr auto scheme = "file://"sv;
        if (!uri.starts_with(scheme)) {
            return fs::path{std::string{uri}};
        }
        uri.remove_prefix(scheme.size());
        // file://host/path is not produced by local servers; drop an explicit localhost
        if (uri.starts_with("localhost/"sv)) {
            uri.remove_prefix("localhost"sv.size());
        }

        std::string decoded{};
        decoded.reserve(uri.size());
        for (size_t i = 0; i < uri.size(); ++i) {
            if (uri[i] == '%' && i + 2 < uri.size()) {
                auto hi = detail::hex_value(uri[i + 1]);
                auto lo = detail::hex_value(uri[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    decoded.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            decoded.push_back(uri[i]);
        }
        return fs::path{decoded};
    }

    std::string_view language_id_for(const fs::path& path) {
        auto ext = path.extension().string();
        if (ext == ".swift") {
            return "swift"sv;
        }
        if (ext == ".c" || ext == ".h") {
            return "c"sv;
        }
        if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" || ext == ".hxx") {
            return "cpp"sv;
        }
        if (ext == ".m") {
            return "objective-c"sv;
        }
        if (ext == ".mm") {
            return "objective-cpp"sv;
        }
        if (ext == ".rs") {
            return "rust"sv;
        }
        if (ext == ".go") {
            return "go"sv;
        }
        return "plaintext"sv;
    }

    std::string_view symbol_kind_name(int kind) {
        static constexpr std::array<std::string_view, 27> names{
                "unknown"sv,   "file"sv,          "module"sv,    "namespace"sv, "package"sv, "class"sv,
                "method"sv,    "property"sv,      "field"sv,     "constructor"sv, "enum"sv,  "interface"sv,
                "function"sv,  "variable"sv,      "constant"sv,  "string"sv,    "number"sv,  "boolean"sv,
                "array"sv,     "object"sv,        "key"sv,       "null"sv,      "enum_member"sv, "struct"sv,
                "event"sv,     "operator"sv,      "type_parameter"sv};
        if (kind < 0 || static_cast<size_t>(kind) >= names.size()) {
            return "unknown"sv;
        }
        return names[static_cast<size_t>(kind)];
    }

}  // namespace lsbridge

#include "lsbridge/config.hpp"

#include "lsbridge/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace lsbridge::literals;
namespace fs = std::filesystem;

namespace lsbridge {

    namespace detail {

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static void require_positive(std::optional<int> value, std::string_view key, const fs::path& path) {
            if (value && *value <= 0) {
                throw std::runtime_error("{} in {} must be positive"_format(key, path.string()));
            }
        }

        static std::optional<int> env_int(const char* name) {
            const char* raw = std::getenv(name);
            if (raw == nullptr) {
                return std::nullopt;
            }
            auto parsed = utils::parse_arithmetic<int>(utils::trim_view(raw));
            if (!parsed || *parsed < 0) {
                log_warn("ignoring invalid ", name, "=", raw);
                return std::nullopt;
            }
            return parsed;
        }

    }  // namespace detail

    void load_config_file(startup_config& cfg, const fs::path& path) {
        persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw std::runtime_error(
                    "failed to parse json file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }
        detail::validate_supported_schema_version(data.schema_version, path);
        detail::require_positive(data.handshake_timeout_ms, "handshake_timeout_ms", path);
        detail::require_positive(data.request_timeout_ms, "request_timeout_ms", path);
        detail::require_positive(data.shutdown_grace_ms, "shutdown_grace_ms", path);
        detail::require_positive(data.reaper_interval_ms, "reaper_interval_ms", path);

        if (data.server_path) {
            cfg.server_path = *data.server_path;
        }
        if (data.server_args) {
            cfg.server_args = *data.server_args;
        }
        if (data.server_log) {
            cfg.server_log = *data.server_log;
        }
        if (data.root_markers) {
            if (data.root_markers->empty()) {
                throw std::runtime_error("root_markers in {} must not be empty"_format(path.string()));
            }
            cfg.root_markers = *data.root_markers;
        }
        if (data.handshake_timeout_ms) {
            cfg.handshake_timeout_ms = *data.handshake_timeout_ms;
        }
        if (data.request_timeout_ms) {
            cfg.request_timeout_ms = *data.request_timeout_ms;
        }
        if (data.shutdown_grace_ms) {
            cfg.shutdown_grace_ms = *data.shutdown_grace_ms;
        }
        if (data.idle_timeout_ms) {
            if (*data.idle_timeout_ms < 0) {
                throw std::runtime_error("idle_timeout_ms in {} must not be negative"_format(path.string()));
            }
            cfg.idle_timeout_ms = *data.idle_timeout_ms;
        }
        if (data.reaper_interval_ms) {
            cfg.reaper_interval_ms = *data.reaper_interval_ms;
        }
        if (data.max_body_bytes) {
            if (*data.max_body_bytes == 0U) {
                throw std::runtime_error("max_body_bytes in {} must be positive"_format(path.string()));
            }
            cfg.max_body_bytes = *data.max_body_bytes;
        }
        if (data.events_file) {
            cfg.events_file = fs::path{*data.events_file};
        }
        if (data.verbosity && !try_parse_log_level(*data.verbosity, cfg.verbosity)) {
            throw std::runtime_error(
                    "invalid verbosity in {}: {} (expected quiet|normal|verbose)"_format(
                            path.string(), *data.verbosity));
        }
    }

    void apply_environment_overrides(startup_config& cfg) {
        if (const char* server = std::getenv("LSBRIDGE_SERVER"); server != nullptr && *server != '\0') {
            cfg.server_path = server;
        }
        if (auto timeout = detail::env_int("LSBRIDGE_REQUEST_TIMEOUT_MS"); timeout && *timeout > 0) {
            cfg.request_timeout_ms = *timeout;
        }
        if (auto idle = detail::env_int("LSBRIDGE_IDLE_TIMEOUT_MS")) {
            cfg.idle_timeout_ms = *idle;
        }
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "server=" << cfg.server_path.string() << '\n';
        os << "server_args=" << utils::join_with_separator(cfg.server_args, " ") << '\n';
        os << "server_log=" << cfg.server_log.string() << '\n';
        os << "root_markers=" << utils::join_with_separator(cfg.root_markers, ",") << '\n';
        os << "handshake_timeout_ms=" << cfg.handshake_timeout_ms << '\n';
        os << "request_timeout_ms=" << cfg.request_timeout_ms << '\n';
        os << "shutdown_grace_ms=" << cfg.shutdown_grace_ms << '\n';
        os << "idle_timeout_ms=" << cfg.idle_timeout_ms << '\n';
        os << "reaper_interval_ms=" << cfg.reaper_interval_ms << '\n';
        os << "max_body_bytes=" << cfg.max_body_bytes << '\n';
        os << "events_file=" << (cfg.events_file ? cfg.events_file->string() : "<none>") << '\n';
        os << "verbosity=" << to_string(cfg.verbosity) << '\n';
        os << "mode=" << to_string(cfg.mode) << '\n';
        os << "history_file=" << (cfg.history_file ? cfg.history_file->string() : "<none>") << '\n';
    }

}  // namespace lsbridge

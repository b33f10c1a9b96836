#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lsbridge {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        spawn_error,
        handshake_timeout,
        protocol_framing_error,
        timeout,
        backend_disconnected,
        invalid_response,
        handshake_not_complete,
        transport_write_error,
        invalid_request,
        io_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::spawn_error:
                return "spawn_error"sv;
            case error_kind::handshake_timeout:
                return "handshake_timeout"sv;
            case error_kind::protocol_framing_error:
                return "protocol_framing_error"sv;
            case error_kind::timeout:
                return "timeout"sv;
            case error_kind::backend_disconnected:
                return "backend_disconnected"sv;
            case error_kind::invalid_response:
                return "invalid_response"sv;
            case error_kind::handshake_not_complete:
                return "handshake_not_complete"sv;
            case error_kind::transport_write_error:
                return "transport_write_error"sv;
            case error_kind::invalid_request:
                return "invalid_request"sv;
            case error_kind::io_error:
                return "io_error"sv;
        }
        return "invalid_response"sv;
    }

    // A session-fatal failure means the backend connection is unusable; the registry entry must be replaced.
    inline constexpr bool is_session_fatal(error_kind kind) {
        switch (kind) {
            case error_kind::protocol_framing_error:
            case error_kind::backend_disconnected:
            case error_kind::transport_write_error:
            case error_kind::handshake_timeout:
            case error_kind::spawn_error:
                return true;
            default:
                return false;
        }
    }

    class session_error : public std::runtime_error {
      public:
        session_error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace lsbridge

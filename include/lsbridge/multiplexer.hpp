#pragma once

#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lsbridge {

    struct rpc_failure {
        int code{};
        std::string message{};
    };

    // What a request slot resolves to: the raw "result" JSON, or the backend's error object.
    struct response_payload {
        std::string result{"null"};
        std::optional<rpc_failure> error{};
    };

    enum class inbound_kind : uint8_t {
        response,
        notification,
        server_request,
        unmatched_response,
        malformed,
    };

    inline constexpr std::string_view to_string(inbound_kind kind) {
        switch (kind) {
            case inbound_kind::response:
                return "response"sv;
            case inbound_kind::notification:
                return "notification"sv;
            case inbound_kind::server_request:
                return "server_request"sv;
            case inbound_kind::unmatched_response:
                return "unmatched_response"sv;
            case inbound_kind::malformed:
                return "malformed"sv;
        }
        return "malformed"sv;
    }

    /*
     * Correlates outgoing requests with inbound responses for one session.
     *
     * Every registered id owns a single-resolution slot. Whichever of resolve(), fail() or
     * fail_all() removes the slot from the table first delivers the outcome; later attempts
     * return false and do nothing. After fail_all() the multiplexer is closed and refuses
     * new registrations.
     */
    class request_multiplexer {
      public:
        using clock = std::chrono::steady_clock;
        using notification_sink = std::function<void(std::string_view method, std::string_view params)>;
        // id_json is the request id exactly as the server sent it
        using server_request_handler =
                std::function<void(std::string_view id_json, std::string_view method, std::string_view params)>;

        request_multiplexer() = default;
        request_multiplexer(notification_sink on_notification, server_request_handler on_server_request)
                : on_notification_{std::move(on_notification)}, on_server_request_{std::move(on_server_request)} {}

        request_multiplexer(const request_multiplexer&) = delete;
        request_multiplexer& operator=(const request_multiplexer&) = delete;

        int64_t next_id() { return next_id_.fetch_add(1, std::memory_order_relaxed); }

        // Must be called before the request is written, so an immediate reply finds its slot.
        std::future<response_payload> register_request(int64_t id, std::string method, clock::time_point deadline);

        bool resolve(int64_t id, response_payload payload);

        bool fail(int64_t id, error_kind kind, const std::string& message);

        // Fails every outstanding slot and closes the multiplexer. Returns the number of slots failed.
        size_t fail_all(error_kind kind, const std::string& message);

        // Classifies one decoded inbound body and routes it.
        inbound_kind dispatch_inbound(std::string_view message);

        size_t pending() const;
        bool closed() const;

      private:
        struct pending_request {
            std::string method{};
            clock::time_point deadline{};
            std::promise<response_payload> promise{};
        };

        std::optional<pending_request> take(int64_t id);

        std::atomic<int64_t> next_id_{1};
        mutable std::mutex mutex_{};
        std::unordered_map<int64_t, pending_request> pending_{};
        std::optional<session_error> closed_with_{};
        notification_sink on_notification_{};
        server_request_handler on_server_request_{};
    };

}  // namespace lsbridge

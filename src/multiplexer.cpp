#include "lsbridge/multiplexer.hpp"

#include "lsbridge/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

using namespace lsbridge::literals;

namespace lsbridge {

    namespace detail {

        static bool is_null_id(const std::optional<glz::raw_json>& id) {
            return !id || utils::trim_view(id->str).empty() || utils::trim_view(id->str) == "null"sv;
        }

    }  // namespace detail

    std::future<response_payload> request_multiplexer::register_request(
            int64_t id, std::string method, clock::time_point deadline) {
        std::lock_guard lock{mutex_};
        if (closed_with_) {
            throw session_error{error_kind::backend_disconnected, closed_with_->what()};
        }

        pending_request slot{.method = std::move(method), .deadline = deadline};
        auto future = slot.promise.get_future();
        auto [it, inserted] = pending_.emplace(id, std::move(slot));
        if (!inserted) {
            throw session_error{error_kind::invalid_request, "request id {} is already outstanding"_format(id)};
        }
        return future;
    }

    std::optional<request_multiplexer::pending_request> request_multiplexer::take(int64_t id) {
        std::lock_guard lock{mutex_};
        auto node = pending_.extract(id);
        if (node.empty()) {
            return std::nullopt;
        }
        return std::move(node.mapped());
    }

    bool request_multiplexer::resolve(int64_t id, response_payload payload) {
        auto slot = take(id);
        if (!slot) {
            debug_log("dropping response for unknown or settled id ", id);
            return false;
        }
        auto now = clock::now();
        if (now > slot->deadline) {
            debug_log(slot->method, " id=", id, " answered ", to_millis(now - slot->deadline), "ms past deadline");
        }
        slot->promise.set_value(std::move(payload));
        return true;
    }

    bool request_multiplexer::fail(int64_t id, error_kind kind, const std::string& message) {
        auto slot = take(id);
        if (!slot) {
            return false;
        }
        debug_log(slot->method, " id=", id, " failed: ", to_string(kind));
        slot->promise.set_exception(std::make_exception_ptr(session_error{kind, message}));
        return true;
    }

    size_t request_multiplexer::fail_all(error_kind kind, const std::string& message) {
        std::unordered_map<int64_t, pending_request> drained{};
        {
            std::lock_guard lock{mutex_};
            if (!closed_with_) {
                closed_with_.emplace(kind, message);
            }
            drained.swap(pending_);
        }
        for (auto& [id, slot] : drained) {
            slot.promise.set_exception(std::make_exception_ptr(session_error{kind, message}));
        }
        return drained.size();
    }

    inbound_kind request_multiplexer::dispatch_inbound(std::string_view message) {
        internal::inbound_envelope envelope{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(envelope, message);
        if (ec) {
            log_warn("discarding unparseable message from language server: ", glz::format_error(ec, message));
            return inbound_kind::malformed;
        }

        bool has_id = !detail::is_null_id(envelope.id);

        if (envelope.method) {
            std::string_view params = envelope.params ? std::string_view{envelope.params->str} : "null"sv;
            if (has_id) {
                if (on_server_request_) {
                    on_server_request_(envelope.id->str, *envelope.method, params);
                }
                return inbound_kind::server_request;
            }
            if (on_notification_) {
                on_notification_(*envelope.method, params);
            }
            return inbound_kind::notification;
        }

        if (!has_id) {
            log_warn("discarding language server message with neither method nor id");
            return inbound_kind::malformed;
        }

        auto id = utils::parse_arithmetic<int64_t>(utils::trim_view(envelope.id->str));
        if (!id) {
            // we only ever send integer ids
            log_warn("dropping response with foreign id ", envelope.id->str);
            return inbound_kind::unmatched_response;
        }

        response_payload payload{};
        if (envelope.error) {
            payload.error = rpc_failure{.code = envelope.error->code, .message = std::move(envelope.error->message)};
        }
        else if (envelope.result) {
            payload.result = std::move(envelope.result->str);
        }

        if (!resolve(*id, std::move(payload))) {
            log_warn("dropping response for unmatched id ", *id);
            return inbound_kind::unmatched_response;
        }
        return inbound_kind::response;
    }

    size_t request_multiplexer::pending() const {
        std::lock_guard lock{mutex_};
        return pending_.size();
    }

    bool request_multiplexer::closed() const {
        std::lock_guard lock{mutex_};
        return closed_with_.has_value();
    }

}  // namespace lsbridge

#include "lsbridge/events.hpp"

#include "lsbridge/errors.hpp"
#include "lsbridge/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

using namespace lsbridge::literals;

namespace lsbridge {

    std::string to_json_line(const execution_event& event) {
        internal::event_record record{
                .tool_name = event.tool_name,
                .session_id = event.session_id,
                .status = std::string{to_string(event.status)},
                .started_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         event.started_at.time_since_epoch())
                                         .count(),
                .duration_ms = event.duration.count(),
                .error_message = event.error_message};

        std::string json{};
        if (auto ec = glz::write_json(record, json); ec) {
            throw std::runtime_error("failed to serialize execution event for {}"_format(event.tool_name));
        }
        return json;
    }

    jsonl_event_sink::jsonl_event_sink(const std::filesystem::path& path) {
        if (path.has_parent_path()) {
            std::error_code ec{};
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        out_.open(path, std::ios::out | std::ios::app);
        if (!out_) {
            throw session_error{error_kind::io_error, "failed to open events file {}"_format(path.string())};
        }
    }

    void jsonl_event_sink::emit(const execution_event& event) {
        auto line = to_json_line(event);
        std::lock_guard lock{mutex_};
        out_ << line << '\n';
        out_.flush();
        if (!out_) {
            log_warn("failed to append execution event for ", event.tool_name);
            out_.clear();
        }
    }

    std::shared_ptr<event_sink> make_event_sink(const std::optional<std::filesystem::path>& events_file) {
        if (events_file) {
            return std::make_shared<jsonl_event_sink>(*events_file);
        }
        return std::make_shared<null_event_sink>();
    }

    void recording_event_sink::emit(const execution_event& event) {
        std::lock_guard lock{mutex_};
        events_.push_back(event);
    }

    std::vector<execution_event> recording_event_sink::snapshot() const {
        std::lock_guard lock{mutex_};
        return events_;
    }

    size_t recording_event_sink::count() const {
        std::lock_guard lock{mutex_};
        return events_.size();
    }

}  // namespace lsbridge

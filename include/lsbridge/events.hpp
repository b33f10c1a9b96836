#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsbridge {

    using namespace std::string_view_literals;

    enum class event_status : uint8_t { success, error, in_progress };

    inline constexpr std::string_view to_string(event_status status) {
        switch (status) {
            case event_status::success:
                return "success"sv;
            case event_status::error:
                return "error"sv;
            case event_status::in_progress:
                return "in_progress"sv;
        }
        return "error"sv;
    }

    // One completed or failed operation, as seen by observers. session_id is the project root.
    struct execution_event {
        std::string tool_name{};
        std::string session_id{};
        event_status status{event_status::success};
        std::chrono::system_clock::time_point started_at{};
        std::chrono::milliseconds duration{};
        std::optional<std::string> error_message{};
    };

    class event_sink {
      public:
        virtual ~event_sink() = default;

        // Called from arbitrary caller threads; implementations synchronize themselves.
        virtual void emit(const execution_event& event) = 0;
    };

    class null_event_sink final : public event_sink {
      public:
        void emit(const execution_event&) override {}
    };

    // Appends one JSON object per line.
    class jsonl_event_sink final : public event_sink {
      public:
        explicit jsonl_event_sink(const std::filesystem::path& path);

        void emit(const execution_event& event) override;

      private:
        std::mutex mutex_{};
        std::ofstream out_{};
    };

    // Keeps events in memory; used by the repl and tests.
    class recording_event_sink final : public event_sink {
      public:
        void emit(const execution_event& event) override;

        std::vector<execution_event> snapshot() const;
        size_t count() const;

      private:
        mutable std::mutex mutex_{};
        std::vector<execution_event> events_{};
    };

    // JSON-lines sink when a path is configured, otherwise a null sink.
    std::shared_ptr<event_sink> make_event_sink(const std::optional<std::filesystem::path>& events_file);

    // Serialized form of one event, exactly as jsonl_event_sink writes it (without the newline).
    std::string to_json_line(const execution_event& event);

}  // namespace lsbridge

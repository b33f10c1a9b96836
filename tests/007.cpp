#include "utils.hpp"

namespace lsbridge::test {

    namespace {
        execution_event sample_event(event_status status, std::optional<std::string> error = std::nullopt) {
            return execution_event{
                    .tool_name = "hover",
                    .session_id = "/work/App",
                    .status = status,
                    .started_at = std::chrono::system_clock::time_point{std::chrono::milliseconds{1'700'000'000'000}},
                    .duration = 42ms,
                    .error_message = std::move(error)};
        }
    }  // namespace

    TEST_CASE("007: execution events serialize as one json object", "[007][events]") {
        auto line = to_json_line(sample_event(event_status::error, "timeout: too slow"));
        CHECK(line.find('\n') == std::string::npos);

        internal::event_record record{};
        REQUIRE_FALSE(glz::read_json(record, line));
        CHECK(record.tool_name == "hover");
        CHECK(record.session_id == "/work/App");
        CHECK(record.status == "error");
        CHECK(record.started_at_ms == 1'700'000'000'000);
        CHECK(record.duration_ms == 42);
        CHECK(record.error_message == std::optional<std::string>{"timeout: too slow"});

        auto ok = to_json_line(sample_event(event_status::success));
        CHECK(contains(ok, R"("status":"success")"));
        CHECK_FALSE(contains(ok, "error_message"));
    }

    TEST_CASE("007: jsonl sink appends one line per event", "[007][events]") {
        temp_dir dir{"lsbridge_events"};
        auto path = dir.path / "logs" / "events.jsonl";
        {
            auto sink = make_event_sink(path);
            sink->emit(sample_event(event_status::success));
            sink->emit(sample_event(event_status::in_progress));
        }
        {
            jsonl_event_sink again{path};
            again.emit(sample_event(event_status::error, "backend_disconnected: gone"));
        }

        auto text = read_file(path);
        CHECK(std::ranges::count(text, '\n') == 3);
        CHECK(contains(text, R"("status":"in_progress")"));
        CHECK(contains(text, "backend_disconnected: gone"));
    }

    TEST_CASE("007: unwritable events file is an io error", "[007][events]") {
        temp_dir dir{"lsbridge_events_bad"};
        write_file(dir.path / "file", "");
        CHECK(error_kind_of([&] { jsonl_event_sink sink{dir.path / "file" / "events.jsonl"}; }) ==
              error_kind::io_error);
    }

    TEST_CASE("007: default sink discards and recording sink keeps events", "[007][events]") {
        auto sink = make_event_sink(std::nullopt);
        REQUIRE(sink != nullptr);
        sink->emit(sample_event(event_status::success));

        recording_event_sink recorder{};
        std::vector<std::thread> threads{};
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&] {
                for (int j = 0; j < 25; ++j) {
                    recorder.emit(sample_event(event_status::success));
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        CHECK(recorder.count() == 100U);
        CHECK(recorder.snapshot().front().tool_name == "hover");
    }

}  // namespace lsbridge::test

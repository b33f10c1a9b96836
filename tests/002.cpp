#include "utils.hpp"

namespace lsbridge::test {

    TEST_CASE("002: encode_frame writes a Content-Length header", "[002][transport]") {
        CHECK(encode_frame(R"({"a":1})") == "Content-Length: 7\r\n\r\n{\"a\":1}");
        CHECK(encode_frame("") == "Content-Length: 0\r\n\r\n");
    }

    TEST_CASE("002: decoder reassembles frames split at arbitrary points", "[002][transport]") {
        auto stream = encode_frame(R"({"id":1})") + encode_frame(R"({"id":2,"text":"héllo"})");

        for (size_t chunk = 1; chunk <= stream.size(); chunk += 3) {
            frame_decoder decoder{};
            std::vector<std::string> bodies{};
            for (size_t off = 0; off < stream.size(); off += chunk) {
                decoder.feed(std::string_view{stream}.substr(off, chunk));
                while (auto body = decoder.next()) {
                    bodies.push_back(*body);
                }
            }
            REQUIRE(bodies.size() == 2U);
            CHECK(bodies[0] == R"({"id":1})");
            CHECK(bodies[1] == R"({"id":2,"text":"héllo"})");
            CHECK(decoder.buffered() == 0U);
        }
    }

    TEST_CASE("002: decoder tolerates extra headers and header case", "[002][transport]") {
        frame_decoder decoder{};
        decoder.feed("content-length: 2\r\nContent-Type: application/vscode-jsonrpc; charset=utf-8\r\n\r\n{}");
        auto body = decoder.next();
        REQUIRE(body.has_value());
        CHECK(*body == "{}");
        CHECK_FALSE(decoder.next().has_value());
    }

    TEST_CASE("002: malformed header sections are framing errors", "[002][transport]") {
        auto framing_kind = [](std::string_view bytes, size_t limit = default_max_body_bytes) {
            frame_decoder decoder{limit};
            decoder.feed(bytes);
            return error_kind_of([&] { (void)decoder.next(); });
        };

        CHECK(framing_kind("Content-Type: text\r\n\r\n{}") == error_kind::protocol_framing_error);
        CHECK(framing_kind("Content-Length: abc\r\n\r\n") == error_kind::protocol_framing_error);
        CHECK(framing_kind("garbage without colon\r\n\r\n") == error_kind::protocol_framing_error);
        CHECK(framing_kind("Content-Length: 2\r\nContent-Length: 3\r\n\r\n{}") == error_kind::protocol_framing_error);
        CHECK(framing_kind("Content-Length: 100\r\n\r\n", 10) == error_kind::protocol_framing_error);
        CHECK(framing_kind(std::string(5000, 'x')) == error_kind::protocol_framing_error);
    }

    TEST_CASE("002: partial body waits for more bytes", "[002][transport]") {
        frame_decoder decoder{};
        decoder.feed("Content-Length: 10\r\n\r\n12345");
        CHECK_FALSE(decoder.next().has_value());
        decoder.feed("67890");
        auto body = decoder.next();
        REQUIRE(body.has_value());
        CHECK(*body == "1234567890");
    }

    TEST_CASE("002: transport channel round trip over pipes", "[002][transport]") {
        int to_peer[2]{};
        int from_peer[2]{};
        REQUIRE(::pipe(to_peer) == 0);
        REQUIRE(::pipe(from_peer) == 0);

        transport_channel channel{to_peer[1], from_peer[0]};

        channel.send(R"({"method":"ping"})", std::chrono::steady_clock::now() + 1s);
        char buf[256]{};
        auto n = ::read(to_peer[0], buf, sizeof(buf));
        REQUIRE(n > 0);
        CHECK(std::string_view{buf, static_cast<size_t>(n)} == encode_frame(R"({"method":"ping"})"));

        auto reply = encode_frame(R"({"id":1,"result":null})");
        REQUIRE(::write(from_peer[1], reply.data(), reply.size()) == static_cast<ssize_t>(reply.size()));
        auto frame = channel.next_frame();
        REQUIRE(frame.has_value());
        CHECK(*frame == R"({"id":1,"result":null})");

        ::close(from_peer[1]);
        CHECK_FALSE(channel.next_frame().has_value());

        channel.close_write();
        CHECK(channel.write_closed());
        CHECK(error_kind_of([&] { channel.send("{}", std::chrono::steady_clock::now() + 1s); }) ==
              error_kind::transport_write_error);
        ::close(to_peer[0]);
    }

    TEST_CASE("002: a frame the peer does not read in time stays queued in order", "[002][transport]") {
        int to_peer[2]{};
        int from_peer[2]{};
        REQUIRE(::pipe(to_peer) == 0);
        REQUIRE(::pipe(from_peer) == 0);

        transport_channel channel{to_peer[1], from_peer[0]};
        std::string big(1U << 20U, 'x');

        auto started = std::chrono::steady_clock::now();
        CHECK(error_kind_of([&] { channel.send(big, std::chrono::steady_clock::now() + 200ms); }) ==
              error_kind::timeout);
        CHECK(std::chrono::steady_clock::now() - started < 2s);
        CHECK(channel.queued_bytes() > 0U);
        CHECK_FALSE(channel.write_closed());

        auto drained = std::async(std::launch::async, [fd = to_peer[0]] {
            std::string all{};
            std::vector<char> buf(1U << 16U);
            for (;;) {
                auto n = ::read(fd, buf.data(), buf.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return all;
                }
                all.append(buf.data(), static_cast<size_t>(n));
            }
        });

        channel.send(R"({"method":"after"})", std::chrono::steady_clock::now() + 5s);
        CHECK(channel.queued_bytes() == 0U);
        channel.close_write();

        REQUIRE(drained.wait_for(5s) == std::future_status::ready);
        auto all = drained.get();
        CHECK(all.size() == encode_frame(big).size() + encode_frame(R"({"method":"after"})").size());
        CHECK(all == encode_frame(big) + encode_frame(R"({"method":"after"})"));

        ::close(to_peer[0]);
        ::close(from_peer[1]);
    }

    TEST_CASE("002: close_write does not wait on a full pipe", "[002][transport]") {
        int to_peer[2]{};
        int from_peer[2]{};
        REQUIRE(::pipe(to_peer) == 0);
        REQUIRE(::pipe(from_peer) == 0);

        transport_channel channel{to_peer[1], from_peer[0]};
        std::string big(1U << 20U, 'y');

        auto sender = std::async(std::launch::async, [&]() -> std::optional<error_kind> {
            try {
                channel.send(big, std::chrono::steady_clock::now() + 30s);
            } catch (const session_error& e) {
                return e.kind();
            }
            return std::nullopt;
        });
        REQUIRE(eventually([&] { return channel.queued_bytes() > 0U; }));

        auto started = std::chrono::steady_clock::now();
        channel.close_write();
        CHECK(std::chrono::steady_clock::now() - started < 2s);
        REQUIRE(sender.wait_for(2s) == std::future_status::ready);
        CHECK(sender.get() == std::optional<error_kind>{error_kind::transport_write_error});

        ::close(to_peer[0]);
        ::close(from_peer[1]);
    }

    TEST_CASE("002: interrupt unblocks a waiting reader", "[002][transport]") {
        int to_peer[2]{};
        int from_peer[2]{};
        REQUIRE(::pipe(to_peer) == 0);
        REQUIRE(::pipe(from_peer) == 0);

        transport_channel channel{to_peer[1], from_peer[0]};
        auto reader = std::async(std::launch::async, [&] { return channel.next_frame(); });

        std::this_thread::sleep_for(50ms);
        CHECK(reader.wait_for(0ms) == std::future_status::timeout);
        channel.interrupt();
        REQUIRE(reader.wait_for(2s) == std::future_status::ready);
        CHECK_FALSE(reader.get().has_value());

        ::close(to_peer[0]);
        ::close(from_peer[1]);
    }

}  // namespace lsbridge::test

#include "lsbridge/transport.hpp"

#include "lsbridge/errors.hpp"
#include "lsbridge/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

using namespace lsbridge::literals;
using namespace std::string_view_literals;

namespace lsbridge {

    namespace detail {

        static constexpr auto header_terminator = "\r\n\r\n"sv;
        static constexpr size_t max_header_bytes = 4096U;
        // Upper bound on one wait for pipe space; keeps close_write() prompt.
        static constexpr std::chrono::milliseconds write_poll_slice{50};

        [[noreturn]] static void framing_error(const std::string& message) {
            throw session_error{error_kind::protocol_framing_error, message};
        }

        static size_t parse_header_section(std::string_view headers, size_t max_body_bytes) {
            std::optional<size_t> content_length{};
            size_t pos = 0;
            while (pos < headers.size()) {
                auto eol = headers.find("\r\n"sv, pos);
                if (eol == std::string_view::npos) {
                    eol = headers.size();
                }
                auto line = headers.substr(pos, eol - pos);
                pos = eol + 2;

                auto colon = line.find(':');
                if (colon == std::string_view::npos || colon == 0) {
                    framing_error("malformed header line: '{}'"_format(line));
                }
                auto name = utils::trim_view(line.substr(0, colon));
                auto value = utils::trim_view(line.substr(colon + 1));

                if (!utils::str_case_eq(name, "Content-Length"sv)) {
                    // Content-Type and future headers carry nothing we act on
                    continue;
                }
                auto parsed = utils::parse_arithmetic<size_t>(value);
                if (!parsed) {
                    framing_error("invalid Content-Length: '{}'"_format(value));
                }
                if (content_length && *content_length != *parsed) {
                    framing_error("conflicting Content-Length headers");
                }
                content_length = *parsed;
            }

            if (!content_length) {
                framing_error("missing Content-Length header");
            }
            if (*content_length > max_body_bytes) {
                framing_error("Content-Length {} exceeds limit {}"_format(*content_length, max_body_bytes));
            }
            return *content_length;
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

    }  // namespace detail

    std::string encode_frame(std::string_view body) {
        std::string frame{"Content-Length: {}\r\n\r\n"_format(body.size())};
        frame.append(body);
        return frame;
    }

    std::optional<std::string> frame_decoder::next() {
        if (!pending_body_) {
            auto end = buffer_.find(detail::header_terminator);
            if (end == std::string::npos) {
                if (buffer_.size() > detail::max_header_bytes) {
                    detail::framing_error("header section exceeds {} bytes"_format(detail::max_header_bytes));
                }
                return std::nullopt;
            }
            if (end == 0) {
                detail::framing_error("empty header section");
            }
            pending_body_ = detail::parse_header_section(std::string_view{buffer_}.substr(0, end), max_body_bytes_);
            buffer_.erase(0, end + detail::header_terminator.size());
        }

        if (buffer_.size() < *pending_body_) {
            return std::nullopt;
        }

        std::string body = buffer_.substr(0, *pending_body_);
        buffer_.erase(0, *pending_body_);
        pending_body_.reset();
        return body;
    }

    transport_channel::transport_channel(int write_fd, int read_fd, size_t max_body_bytes)
            : write_fd_{write_fd}, read_fd_{read_fd}, decoder_{max_body_bytes} {
        auto fail = [this](const char* what) {
            int err = errno;
            detail::close_fd(write_fd_);
            detail::close_fd(read_fd_);
            detail::close_fd(wake_fds_[0]);
            detail::close_fd(wake_fds_[1]);
            throw session_error{error_kind::spawn_error, "{} failed for transport: {}"_format(what, std::strerror(err))};
        };

        if (::pipe2(wake_fds_, O_CLOEXEC) != 0) {
            fail("pipe2()");
        }
        int flags = ::fcntl(write_fd_, F_GETFL);
        if (flags < 0 || ::fcntl(write_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
            fail("fcntl(O_NONBLOCK)");
        }
    }

    transport_channel::~transport_channel() {
        detail::close_fd(write_fd_);
        detail::close_fd(read_fd_);
        detail::close_fd(wake_fds_[0]);
        detail::close_fd(wake_fds_[1]);
    }

    void transport_channel::flush_locked() {
        while (!outbound_.empty()) {
            auto n = ::write(write_fd_, outbound_.data(), outbound_.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return;
                }
                int err = errno;
                // the stream is unusable; later senders fail fast
                write_closed_ = true;
                outbound_.clear();
                write_cv_.notify_all();
                throw session_error{
                        error_kind::transport_write_error, "write to language server failed: {}"_format(std::strerror(err))};
            }
            outbound_.erase(0, static_cast<size_t>(n));
            written_bytes_ += static_cast<uint64_t>(n);
        }
    }

    void transport_channel::send(std::string_view body, clock::time_point deadline) {
        auto frame = encode_frame(body);

        std::unique_lock lock{write_mutex_};
        if (write_closed_) {
            throw session_error{error_kind::transport_write_error, "transport is closed for writing"};
        }
        outbound_.append(frame);
        committed_bytes_ += frame.size();
        auto mark = committed_bytes_;
        flush_locked();

        // released with the lock held on every exit path
        struct waiter_guard {
            transport_channel& channel;
            explicit waiter_guard(transport_channel& ch) : channel{ch} { ++channel.write_waiters_; }
            ~waiter_guard() {
                --channel.write_waiters_;
                channel.write_cv_.notify_all();
            }
        } guard{*this};

        while (written_bytes_ < mark) {
            if (write_closed_) {
                throw session_error{error_kind::transport_write_error, "transport was closed before the frame was written"};
            }
            auto now = clock::now();
            if (now >= deadline) {
                throw session_error{
                        error_kind::timeout,
                        "language server is not reading its input; {} byte(s) still queued"_format(outbound_.size())};
            }
            auto slice = std::min(
                    std::chrono::ceil<std::chrono::milliseconds>(deadline - now), detail::write_poll_slice);

            pollfd pfd{.fd = write_fd_, .events = POLLOUT, .revents = 0};
            lock.unlock();
            int ret = ::poll(&pfd, 1, static_cast<int>(slice.count()));
            int err = errno;
            lock.lock();

            if (ret < 0 && err != EINTR) {
                throw session_error{error_kind::transport_write_error, "poll() failed: {}"_format(std::strerror(err))};
            }
            if (!write_closed_) {
                flush_locked();
            }
        }
    }

    std::optional<std::string> transport_channel::next_frame() {
        for (;;) {
            if (auto body = decoder_.next()) {
                return body;
            }
            if (interrupted_.load()) {
                return std::nullopt;
            }

            pollfd fds[3]{};
            fds[0] = {.fd = read_fd_, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = wake_fds_[0], .events = POLLIN, .revents = 0};
            nfds_t count = 2;
            int timeout_ms = -1;

            // the reader also drains queued output nobody is waiting on
            {
                std::lock_guard lock{write_mutex_};
                if (!write_closed_ && !outbound_.empty()) {
                    fds[2] = {.fd = write_fd_, .events = POLLOUT, .revents = 0};
                    count = 3;
                    timeout_ms = static_cast<int>(detail::write_poll_slice.count());
                    ++write_waiters_;
                }
            }

            int ret = ::poll(fds, count, timeout_ms);
            int err = errno;

            if (count == 3) {
                std::lock_guard lock{write_mutex_};
                --write_waiters_;
                write_cv_.notify_all();
                if (!write_closed_ && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
                    try {
                        flush_locked();
                    } catch (const session_error& e) {
                        log_warn("dropping queued output: ", e.what());
                    }
                }
            }

            if (ret < 0) {
                if (err == EINTR) {
                    continue;
                }
                throw session_error{error_kind::backend_disconnected, "poll() failed: {}"_format(std::strerror(err))};
            }

            if ((fds[1].revents & POLLIN) != 0) {
                return std::nullopt;
            }
            if ((fds[0].revents & POLLNVAL) != 0) {
                throw session_error{error_kind::backend_disconnected, "language server output is closed"};
            }
            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            char chunk[4096]{};
            auto n = ::read(read_fd_, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                throw session_error{
                        error_kind::backend_disconnected, "read from language server failed: {}"_format(std::strerror(errno))};
            }
            if (n == 0) {
                if (decoder_.buffered() > 0) {
                    debug_log("eof with ", decoder_.buffered(), " undelivered bytes");
                }
                return std::nullopt;
            }
            decoder_.feed(std::string_view{chunk, static_cast<size_t>(n)});
        }
    }

    void transport_channel::interrupt() {
        if (interrupted_.exchange(true)) {
            return;
        }
        char byte = 1;
        while (::write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
        }
    }

    void transport_channel::close_write() {
        std::unique_lock lock{write_mutex_};
        write_closed_ = true;
        // waiters poll in short slices and leave once they see write_closed_
        write_cv_.wait(lock, [this] { return write_waiters_ == 0; });
        if (!outbound_.empty()) {
            debug_log("dropping ", outbound_.size(), " queued byte(s) on close");
            outbound_.clear();
        }
        detail::close_fd(write_fd_);
    }

    bool transport_channel::write_closed() const {
        std::lock_guard lock{write_mutex_};
        return write_closed_;
    }

    size_t transport_channel::queued_bytes() const {
        std::lock_guard lock{write_mutex_};
        return outbound_.size();
    }

}  // namespace lsbridge

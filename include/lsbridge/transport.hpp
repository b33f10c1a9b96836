#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lsbridge {

    inline constexpr size_t default_max_body_bytes = 64U << 20U;

    // "Content-Length: <n>\r\n\r\n<body>"
    std::string encode_frame(std::string_view body);

    /*
     * Incremental decoder for the language server base protocol.
     *
     * Bytes are fed in arbitrary chunks; next() yields complete bodies in order. Any
     * malformed header section throws session_error{protocol_framing_error}; the decoder
     * is unusable afterwards, since the stream position is lost.
     */
    class frame_decoder {
      public:
        explicit frame_decoder(size_t max_body_bytes = default_max_body_bytes) : max_body_bytes_{max_body_bytes} {}

        void feed(std::string_view bytes) { buffer_.append(bytes); }

        std::optional<std::string> next();

        size_t buffered() const { return buffer_.size(); }

      private:
        std::string buffer_{};
        size_t max_body_bytes_;
        std::optional<size_t> pending_body_{};
    };

    /*
     * Framed byte stream over a child's stdin/stdout pipe pair.
     *
     * Owns both descriptors. send() is safe from any thread; next_frame() must only be
     * called by the single inbound reader. interrupt() unblocks the reader from another
     * thread without touching the descriptors it is polling.
     *
     * The write side is non-blocking. Every frame handed to send() is committed to an
     * ordered outbound queue; send() then waits until its frame has reached the pipe or
     * the deadline passes. A frame still queued at the deadline stays queued and is
     * flushed later, by the next sender or by the reader while it waits for input, so
     * the byte stream is never torn.
     */
    class transport_channel {
      public:
        using clock = std::chrono::steady_clock;

        transport_channel(int write_fd, int read_fd, size_t max_body_bytes = default_max_body_bytes);
        ~transport_channel();

        transport_channel(const transport_channel&) = delete;
        transport_channel& operator=(const transport_channel&) = delete;

        // Throws session_error{timeout} when the frame is still queued at deadline, and
        // session_error{transport_write_error} once the peer has gone away.
        void send(std::string_view body, clock::time_point deadline);

        // Blocks for the next inbound body. Returns nullopt on EOF or after interrupt().
        std::optional<std::string> next_frame();

        void interrupt();

        // Closes the server's stdin; the server observes EOF. Queued bytes are dropped.
        void close_write();

        bool write_closed() const;

        // Outbound bytes not yet accepted by the pipe.
        size_t queued_bytes() const;

      private:
        // Writes as much of the queue as the pipe takes without blocking. Requires write_mutex_.
        void flush_locked();

        int write_fd_{-1};
        int read_fd_{-1};
        int wake_fds_[2]{-1, -1};

        mutable std::mutex write_mutex_{};
        std::condition_variable write_cv_{};
        std::string outbound_{};
        uint64_t committed_bytes_{0};
        uint64_t written_bytes_{0};
        size_t write_waiters_{0};
        bool write_closed_{false};

        std::atomic<bool> interrupted_{false};
        frame_decoder decoder_;
    };

}  // namespace lsbridge

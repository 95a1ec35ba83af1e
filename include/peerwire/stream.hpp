#pragma once

#include <memory>
#include <peerwire/endpoint.hpp>

namespace peerwire {

    // Abstract base class for all stream-oriented (connection-based) transports
    // Streams are reliable, ordered, connection-oriented byte pipes
    // Every frame on the wire is [length:4 big-endian][payload:length]
    class Stream {
      public:
        virtual ~Stream() = default;

        // Connection establishment - client side
        // Blocks until connected or fails
        virtual dp::Res<void> connect(const Address &address) = 0;

        // Connection establishment - server side
        // Binds to local address and starts listening
        // A TCP port of 0 (or an empty IPC path) lets the transport pick one; see local_address()
        virtual dp::Res<void> listen(const Address &address) = 0;

        // Accept incoming connection - server side
        // Blocks until a client connects
        // The original stream continues listening
        virtual dp::Res<std::unique_ptr<Stream>> accept() = 0;

        // Send one frame
        // Blocks until the entire frame is handed to the OS or the send timeout elapses
        virtual dp::Res<void> send(const Bytes &frame) = 0;

        // Receive one frame
        // Blocks until a complete frame arrives or the receive timeout elapses
        virtual dp::Res<Bytes> recv() = 0;

        // Raw bytes currently readable, without blocking and without framing
        // Returns 0 when nothing is available; a closed or failed connection is an error.
        // Used by readers that reassemble frames themselves (see FrameAssembler).
        virtual dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize capacity) = 0;

        // Timeouts in milliseconds, negative means block forever
        virtual dp::Res<void> set_recv_timeout(dp::i32 timeout_ms) = 0;
        virtual dp::Res<void> set_send_timeout(dp::i32 timeout_ms) = 0;

        // Close the connection and release resources
        virtual void close() = 0;

        virtual bool is_connected() const = 0;

        // Underlying descriptor for readiness polling, -1 when closed
        virtual dp::i32 fd() const = 0;

        // Address this stream is bound to (listening side)
        virtual Address local_address() const = 0;
    };

    namespace detail {

        inline dp::Res<void> set_socket_timeout(dp::i32 fd, dp::i32 option, dp::i32 timeout_ms) {
            if (fd < 0) {
                echo::error("set timeout called but socket not created");
                return dp::result::err(dp::Error::invalid_argument("socket not created"));
            }

            struct timeval tv = to_timeval(timeout_ms);
            if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
                echo::error("setsockopt timeout failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("failed to set timeout"));
            }

            echo::trace("set ", option == SO_RCVTIMEO ? "recv" : "send", " timeout to ", timeout_ms, "ms on fd=", fd);
            return dp::result::ok();
        }

        // Length-prefixed frame write shared by every stream transport
        // `written` counts header and payload bytes that reached the socket. A failure
        // with written > 0 leaves a partial frame on the wire.
        inline dp::Res<void> send_frame(dp::i32 fd, const Bytes &frame, dp::usize &written) {
            written = 0;
            if (frame.size() > MAX_FRAME_SIZE) {
                echo::warn("frame too large: ", frame.size(), " > ", MAX_FRAME_SIZE);
                return dp::result::err(dp::Error::invalid_argument("frame exceeds maximum size"));
            }

            auto length_bytes = encode_u32_be(static_cast<dp::u32>(frame.size()));
            dp::usize header_written = 0;
            auto res = write_exact(fd, length_bytes.data(), 4, header_written);
            written += header_written;
            if (res.is_err()) {
                return res;
            }
            if (!frame.empty()) {
                dp::usize payload_written = 0;
                res = write_exact(fd, frame.data(), frame.size(), payload_written);
                written += payload_written;
                if (res.is_err()) {
                    return res;
                }
            }

            echo::trace("sent frame of ", frame.size(), " bytes (fd=", fd, ")");
            return dp::result::ok();
        }

        // Length-prefixed frame read shared by every stream transport
        // A timeout before the first byte is a plain timeout. Once part of the frame was
        // consumed the stream cannot resynchronize, so a later timeout is an io_error.
        inline dp::Res<Bytes> recv_frame(dp::i32 fd) {
            dp::Array<dp::u8, 4> length_bytes;
            dp::usize header_read = 0;
            auto res = read_exact(fd, length_bytes.data(), 4, header_read);
            if (res.is_err()) {
                if (header_read > 0 && res.error().code == dp::Error::TIMEOUT) {
                    return dp::result::err(dp::Error::io_error("receive timed out mid-frame"));
                }
                return dp::result::err(res.error());
            }

            dp::u32 length = decode_u32_be(length_bytes.data());
            if (length > MAX_FRAME_SIZE) {
                echo::error("received frame too large: ", length, " bytes (max: ", MAX_FRAME_SIZE, ")");
                return dp::result::err(dp::Error::invalid_argument("frame exceeds maximum size"));
            }

            Bytes frame(length);
            if (length > 0) {
                dp::usize payload_read = 0;
                res = read_exact(fd, frame.data(), length, payload_read);
                if (res.is_err()) {
                    if (res.error().code == dp::Error::TIMEOUT) {
                        return dp::result::err(dp::Error::io_error("receive timed out mid-frame"));
                    }
                    return dp::result::err(res.error());
                }
            }

            echo::trace("received frame of ", length, " bytes (fd=", fd, ")");
            return dp::result::ok(std::move(frame));
        }

    } // namespace detail

    /// Rebuilds length-prefixed frames from bytes that arrive in arbitrary pieces
    class FrameAssembler {
      private:
        Bytes buffer_;
        dp::usize consumed_ = 0;

      public:
        void append(const dp::u8 *data, dp::usize size) {
            // Drop consumed bytes before the buffer grows again
            if (consumed_ > 0 && consumed_ * 2 >= buffer_.size()) {
                buffer_ = Bytes(buffer_.begin() + static_cast<dp::isize>(consumed_), buffer_.end());
                consumed_ = 0;
            }
            buffer_.insert(buffer_.end(), data, data + size);
        }

        /// Moves the next complete frame into `frame`
        /// ok(false) means more bytes are needed; an oversized length prefix is an error
        dp::Res<bool> next(Bytes &frame) {
            dp::usize available = buffer_.size() - consumed_;
            if (available < 4) {
                return dp::result::ok(false);
            }

            dp::u32 length = decode_u32_be(buffer_.data() + consumed_);
            if (length > MAX_FRAME_SIZE) {
                echo::error("received frame too large: ", length, " bytes (max: ", MAX_FRAME_SIZE, ")");
                return dp::result::err(dp::Error::invalid_argument("frame exceeds maximum size"));
            }
            if (available - 4 < length) {
                return dp::result::ok(false);
            }

            auto begin = buffer_.begin() + static_cast<dp::isize>(consumed_ + 4);
            frame = Bytes(begin, begin + static_cast<dp::isize>(length));
            consumed_ += 4 + length;
            return dp::result::ok(true);
        }

        /// True when next() would yield a frame
        bool has_frame() const {
            dp::usize available = buffer_.size() - consumed_;
            if (available < 4) {
                return false;
            }
            dp::u32 length = decode_u32_be(buffer_.data() + consumed_);
            return length <= MAX_FRAME_SIZE && available - 4 >= length;
        }

        /// Bytes received but not yet handed out as frames
        dp::usize buffered() const { return buffer_.size() - consumed_; }
    };

} // namespace peerwire

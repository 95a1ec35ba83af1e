#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace peerwire {

    // Raw frame payload - just a vector of bytes
    using Bytes = dp::Vector<dp::u8>;

    // Upper bound for a single length-prefixed frame (64 MiB)
    constexpr dp::u32 MAX_FRAME_SIZE = 64u * 1024u * 1024u;

    // Big-endian encoding for length-prefix framing
    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    // Big-endian decoding for length-prefix framing
    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        return (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
               (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
    }

    // Helper to encode u32 directly into a vector
    inline void append_u32_be(Bytes &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    // Socket timeouts are given in milliseconds, negative meaning "block forever".
    // SO_RCVTIMEO/SO_SNDTIMEO use a zero timeval for "forever", so 0ms is rounded up to 1ms.
    inline struct timeval to_timeval(dp::i32 timeout_ms) {
        struct timeval tv = {};
        if (timeout_ms < 0) {
            return tv;
        }
        if (timeout_ms == 0) {
            timeout_ms = 1;
        }
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        return tv;
    }

    // Helper to read exactly n bytes from a socket
    // ERROR CATEGORIZATION:
    // - timeout: EAGAIN/EWOULDBLOCK (expected, recoverable)
    // - not_found: connection closed (ECONNRESET, EPIPE, EOF)
    // - io_error: other I/O errors
    // `total_read` reports how many bytes were consumed, also on failure
    inline dp::Res<void> read_exact(dp::i32 fd, dp::u8 *buffer, dp::usize count, dp::usize &total_read) {
        total_read = 0;
        while (total_read < count) {
            dp::isize n = ::read(fd, buffer + total_read, count - total_read);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("read timeout (fd=", fd, ", wanted=", count, ", got=", total_read, ")");
                    return dp::result::err(dp::Error::timeout("read timeout"));
                }
                if (errno == ECONNRESET || errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                    echo::trace("read failed: ", strerror(errno), " (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found(dp::String("connection lost: ") + strerror(errno)));
                }
                echo::trace("read failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
            }

            // EOF - connection closed gracefully
            if (n == 0) {
                echo::trace("connection closed by peer (fd=", fd, ", wanted=", count, ", got=", total_read, ")");
                return dp::result::err(dp::Error::not_found("connection closed by peer"));
            }

            total_read += static_cast<dp::usize>(n);
        }
        return dp::result::ok();
    }

    inline dp::Res<void> read_exact(dp::i32 fd, dp::u8 *buffer, dp::usize count) {
        dp::usize total_read = 0;
        return read_exact(fd, buffer, count, total_read);
    }

    // Helper to write exactly n bytes to a socket
    // MSG_NOSIGNAL keeps a vanished peer from raising SIGPIPE.
    // `written` reports how many bytes reached the socket, also on failure.
    // ERROR CATEGORIZATION:
    // - timeout: send timeout elapsed (SO_SNDTIMEO)
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: other I/O errors
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count, dp::usize &written) {
        written = 0;
        while (written < count) {
            dp::isize n = ::send(fd, buffer + written, count - written, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == ECONNRESET || errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                    echo::trace("write failed: ", strerror(errno), " (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found(dp::String("connection lost: ") + strerror(errno)));
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("write timeout (fd=", fd, ", wanted=", count, ", wrote=", written, ")");
                    return dp::result::err(dp::Error::timeout("write timeout"));
                }
                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            written += static_cast<dp::usize>(n);
        }
        return dp::result::ok();
    }

    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize written = 0;
        return write_exact(fd, buffer, count, written);
    }

    // Reads whatever is available without blocking, at most capacity bytes
    // Returns 0 when nothing is available; EOF and resets are not_found
    inline dp::Res<dp::usize> read_available(dp::i32 fd, dp::u8 *buffer, dp::usize capacity) {
        while (true) {
            dp::isize n = ::recv(fd, buffer, capacity, MSG_DONTWAIT);
            if (n > 0) {
                return dp::result::ok(static_cast<dp::usize>(n));
            }
            if (n == 0) {
                echo::trace("connection closed by peer (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection closed by peer"));
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return dp::result::ok(dp::usize(0));
            }
            if (errno == ECONNRESET || errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                echo::trace("read failed: ", strerror(errno), " (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found(dp::String("connection lost: ") + strerror(errno)));
            }
            echo::trace("read failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
            return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
        }
    }

} // namespace peerwire

#pragma once

#include <peerwire/stream.hpp>

#include <atomic>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace peerwire {

    // Unique socket path under dir: <dir>/peerwire-<pid>-<n>.sock
    inline dp::String make_ipc_path(const dp::String &dir) {
        static std::atomic<dp::u32> counter{0};
        std::string path = dir.empty() ? std::string("/tmp") : std::string(dir.c_str());
        if (path.back() != '/') {
            path += "/";
        }
        path += "peerwire-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + ".sock";
        return dp::String(path.c_str());
    }

    // IPC stream implementation using Unix domain sockets
    // Same semantics as TCP but local-only with filesystem paths
    class IpcStream : public Stream {
      private:
        dp::i32 fd_;
        bool connected_;
        bool listening_;
        bool should_unlink_; // We created the socket file, so we remove it on close
        dp::i32 recv_timeout_ms_;
        dp::i32 send_timeout_ms_;
        IpcEndpoint local_endpoint_;
        IpcEndpoint remote_endpoint_;

        // Private constructor for accepted connections
        IpcStream(dp::i32 fd, const IpcEndpoint &local)
            : fd_(fd), connected_(true), listening_(false), should_unlink_(false), recv_timeout_ms_(-1),
              send_timeout_ms_(-1), local_endpoint_(local), remote_endpoint_{dp::String("client")} {
            echo::debug("IpcStream created from accepted connection fd=", fd);
        }

        void apply_timeouts() {
            if (recv_timeout_ms_ >= 0) {
                auto res = detail::set_socket_timeout(fd_, SO_RCVTIMEO, recv_timeout_ms_);
                if (res.is_err()) {
                    echo::warn("failed to apply recv timeout: ", res.error().message.c_str());
                }
            }
            if (send_timeout_ms_ >= 0) {
                auto res = detail::set_socket_timeout(fd_, SO_SNDTIMEO, send_timeout_ms_);
                if (res.is_err()) {
                    echo::warn("failed to apply send timeout: ", res.error().message.c_str());
                }
            }
        }

        static dp::Res<struct sockaddr_un> make_sockaddr(const IpcEndpoint &endpoint) {
            if (endpoint.path.empty() || endpoint.path.size() >= sizeof(sockaddr_un::sun_path)) {
                echo::error("invalid ipc path: '", endpoint.path.c_str(), "'");
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid ipc path: ") + endpoint.path));
            }
            struct sockaddr_un addr = {};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, endpoint.path.c_str(), sizeof(addr.sun_path) - 1);
            return dp::result::ok(addr);
        }

      public:
        IpcStream()
            : fd_(-1), connected_(false), listening_(false), should_unlink_(false), recv_timeout_ms_(-1),
              send_timeout_ms_(-1) {
            echo::trace("IpcStream constructed");
        }

        ~IpcStream() override {
            if (fd_ >= 0) {
                close();
            }
        }

        IpcStream(const IpcStream &) = delete;
        IpcStream &operator=(const IpcStream &) = delete;

        // Client side: connect to Unix domain socket
        dp::Res<void> connect(const Address &address) override {
            if (address.protocol != Protocol::Ipc) {
                echo::error("IpcStream cannot connect to ", address.to_uri());
                return dp::result::err(dp::Error::invalid_argument("not an ipc address"));
            }
            if (fd_ >= 0) {
                echo::error("connect called on an open stream");
                return dp::result::err(dp::Error::invalid_argument("stream already open"));
            }

            auto addr_res = make_sockaddr(address.ipc);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }
            struct sockaddr_un addr = addr_res.value();

            fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("socket creation failed: ") + strerror(errno)));
            }
            apply_timeouts();

            if (::connect(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                dp::i32 saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                echo::error("connect to ", address.ipc.to_string(), " failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + strerror(saved_errno)));
            }

            connected_ = true;
            remote_endpoint_ = address.ipc;
            echo::debug("IpcStream connected to ", address.ipc.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen; an empty path binds a generated one under /tmp
        dp::Res<void> listen(const Address &address) override {
            if (address.protocol != Protocol::Ipc) {
                echo::error("IpcStream cannot listen on ", address.to_uri());
                return dp::result::err(dp::Error::invalid_argument("not an ipc address"));
            }
            if (fd_ >= 0) {
                echo::error("listen called on an open stream");
                return dp::result::err(dp::Error::invalid_argument("stream already open"));
            }

            IpcEndpoint endpoint = address.ipc;
            if (endpoint.path.empty()) {
                endpoint.path = make_ipc_path("/tmp");
            }

            auto addr_res = make_sockaddr(endpoint);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }
            struct sockaddr_un addr = addr_res.value();

            fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("socket creation failed: ") + strerror(errno)));
            }

            // Clean up a stale socket file left by a previous run
            if (::unlink(endpoint.path.c_str()) < 0 && errno != ENOENT) {
                echo::warn("unlink failed for ", endpoint.path.c_str());
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                dp::i32 saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                echo::error("bind failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("bind failed: ") + strerror(saved_errno)));
            }

            if (::listen(fd_, SOMAXCONN) < 0) {
                dp::i32 saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                ::unlink(endpoint.path.c_str());
                echo::error("listen failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("listen failed: ") + strerror(saved_errno)));
            }

            listening_ = true;
            should_unlink_ = true;
            local_endpoint_ = endpoint;
            echo::info("IpcStream listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        dp::Res<std::unique_ptr<Stream>> accept() override {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            dp::i32 client_fd = ::accept(fd_, nullptr, nullptr);
            if (client_fd < 0) {
                echo::error("accept failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("accept failed: ") + strerror(errno)));
            }

            echo::debug("accepted ipc connection fd=", client_fd);

            auto client_stream = std::unique_ptr<Stream>(new IpcStream(client_fd, local_endpoint_));
            return dp::result::ok(std::move(client_stream));
        }

        // A send timeout with nothing written leaves the stream usable. Once part of the
        // frame is on the wire the stream is closed: the receiver could not resynchronize.
        dp::Res<void> send(const Bytes &frame) override {
            if (!connected_ || fd_ < 0) {
                echo::trace("send called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            dp::usize written = 0;
            auto res = detail::send_frame(fd_, frame, written);
            if (res.is_ok()) {
                return res;
            }
            if (written == 0 && (res.error().code == dp::Error::TIMEOUT || frame.size() > MAX_FRAME_SIZE)) {
                return res;
            }
            if (res.error().code == dp::Error::TIMEOUT) {
                echo::warn("send timed out after ", written, " of ", frame.size() + 4, " bytes, closing fd=", fd_);
                close();
                return dp::result::err(dp::Error::timeout("send timed out mid-frame, connection closed"));
            }
            connected_ = false;
            echo::error("send failed: ", res.error().message.c_str());
            return res;
        }

        // Timeouts are expected behavior - the connection stays alive after one
        dp::Res<Bytes> recv() override {
            if (!connected_ || fd_ < 0) {
                echo::trace("recv called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            auto res = detail::recv_frame(fd_);
            if (res.is_err() && res.error().code != dp::Error::TIMEOUT) {
                connected_ = false;
                echo::trace("recv failed: ", res.error().message.c_str());
            }
            return res;
        }

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize capacity) override {
            if (!connected_ || fd_ < 0) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            auto res = read_available(fd_, buffer, capacity);
            if (res.is_err()) {
                connected_ = false;
                echo::trace("read failed: ", res.error().message.c_str());
            }
            return res;
        }

        dp::Res<void> set_recv_timeout(dp::i32 timeout_ms) override {
            recv_timeout_ms_ = timeout_ms;
            if (fd_ < 0) {
                return dp::result::ok();
            }
            return detail::set_socket_timeout(fd_, SO_RCVTIMEO, timeout_ms);
        }

        dp::Res<void> set_send_timeout(dp::i32 timeout_ms) override {
            send_timeout_ms_ = timeout_ms;
            if (fd_ < 0) {
                return dp::result::ok();
            }
            return detail::set_socket_timeout(fd_, SO_SNDTIMEO, timeout_ms);
        }

        void close() override {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                connected_ = false;

                if (listening_ && should_unlink_) {
                    if (::unlink(local_endpoint_.path.c_str()) < 0) {
                        echo::warn("unlink failed for ", local_endpoint_.path.c_str());
                    }
                    should_unlink_ = false;
                }

                listening_ = false;
                echo::debug("IpcStream closed");
            }
        }

        bool is_connected() const override { return connected_; }

        dp::i32 fd() const override { return fd_; }

        Address local_address() const override { return Address::from_ipc(local_endpoint_); }
    };

} // namespace peerwire

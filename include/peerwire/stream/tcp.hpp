#pragma once

#include <peerwire/stream.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace peerwire {

    // TCP stream implementation using BSD sockets
    // Reliable, ordered, connection-oriented transport
    class TcpStream : public Stream {
      private:
        dp::i32 fd_;
        bool connected_;
        bool listening_;
        dp::i32 recv_timeout_ms_;
        dp::i32 send_timeout_ms_;
        TcpEndpoint local_endpoint_;
        TcpEndpoint remote_endpoint_;

        // Private constructor for accepted connections
        TcpStream(dp::i32 fd, const TcpEndpoint &local, const TcpEndpoint &remote)
            : fd_(fd), connected_(true), listening_(false), recv_timeout_ms_(-1), send_timeout_ms_(-1),
              local_endpoint_(local), remote_endpoint_(remote) {
            echo::debug("TcpStream created from accepted connection fd=", fd);
        }

        // Timeouts configured before the socket existed are applied once it does
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

      public:
        TcpStream()
            : fd_(-1), connected_(false), listening_(false), recv_timeout_ms_(-1), send_timeout_ms_(-1),
              local_endpoint_{"", 0}, remote_endpoint_{"", 0} {
            echo::trace("TcpStream constructed");
        }

        ~TcpStream() override {
            if (fd_ >= 0) {
                close();
            }
        }

        TcpStream(const TcpStream &) = delete;
        TcpStream &operator=(const TcpStream &) = delete;

        // Client side: connect to remote endpoint
        dp::Res<void> connect(const Address &address) override {
            if (address.protocol != Protocol::Tcp) {
                echo::error("TcpStream cannot connect to ", address.to_uri());
                return dp::result::err(dp::Error::invalid_argument("not a tcp address"));
            }
            if (fd_ >= 0) {
                echo::error("connect called on an open stream");
                return dp::result::err(dp::Error::invalid_argument("stream already open"));
            }

            const TcpEndpoint &endpoint = address.tcp;
            echo::trace("connecting to ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("socket creation failed: ") + strerror(errno)));
            }
            apply_timeouts();

            // Resolve hostname
            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(endpoint.port).c_str());
            dp::i32 ret = ::getaddrinfo(endpoint.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("getaddrinfo failed: ") + gai_strerror(ret)));
            }

            ret = ::connect(fd_, result->ai_addr, result->ai_addrlen);
            ::freeaddrinfo(result);

            if (ret < 0) {
                dp::i32 saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                echo::error("connect to ", endpoint.to_string(), " failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + strerror(saved_errno)));
            }

            connected_ = true;
            remote_endpoint_ = endpoint;
            echo::debug("TcpStream connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen
        dp::Res<void> listen(const Address &address) override {
            if (address.protocol != Protocol::Tcp) {
                echo::error("TcpStream cannot listen on ", address.to_uri());
                return dp::result::err(dp::Error::invalid_argument("not a tcp address"));
            }
            if (fd_ >= 0) {
                echo::error("listen called on an open stream");
                return dp::result::err(dp::Error::invalid_argument("stream already open"));
            }

            const TcpEndpoint &endpoint = address.tcp;
            echo::trace("listening on ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("socket creation failed: ") + strerror(errno)));
            }

            // Set SO_REUSEADDR to avoid "address already in use" errors
            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);

            if (endpoint.host == "0.0.0.0" || endpoint.host == "*" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else {
                if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                    ::close(fd_);
                    fd_ = -1;
                    echo::error("invalid address: ", endpoint.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument(dp::String("invalid address: ") + endpoint.host));
                }
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
                echo::error("listen failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("listen failed: ") + strerror(saved_errno)));
            }

            // Learn the port the OS picked when asked for port 0
            struct sockaddr_in bound = {};
            socklen_t bound_len = sizeof(bound);
            if (::getsockname(fd_, (struct sockaddr *)&bound, &bound_len) < 0) {
                dp::i32 saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                echo::error("getsockname failed: ", strerror(saved_errno));
                return dp::result::err(dp::Error::io_error(dp::String("getsockname failed: ") + strerror(saved_errno)));
            }

            listening_ = true;
            local_endpoint_ = TcpEndpoint{endpoint.host.empty() ? dp::String("0.0.0.0") : endpoint.host,
                                          ntohs(bound.sin_port)};
            echo::info("TcpStream listening on ", local_endpoint_.to_string());

            return dp::result::ok();
        }

        // Server side: accept incoming connection
        dp::Res<std::unique_ptr<Stream>> accept() override {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            echo::trace("waiting for connection on fd=", fd_);

            struct sockaddr_in client_addr = {};
            socklen_t client_len = sizeof(client_addr);

            dp::i32 client_fd = ::accept(fd_, (struct sockaddr *)&client_addr, &client_len);
            if (client_fd < 0) {
                echo::error("accept failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("accept failed: ") + strerror(errno)));
            }

            char client_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
            TcpEndpoint client_endpoint{dp::String(client_ip), ntohs(client_addr.sin_port)};

            echo::debug("accepted connection from ", client_endpoint.to_string(), " fd=", client_fd);

            auto client_stream = std::unique_ptr<Stream>(new TcpStream(client_fd, local_endpoint_, client_endpoint));
            return dp::result::ok(std::move(client_stream));
        }

        // A send timeout with nothing written leaves the stream usable. Once part of the
        // frame is on the wire the stream is closed: the receiver could not resynchronize.
        dp::Res<void> send(const Bytes &frame) override {
            if (!connected_) {
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

        dp::Res<Bytes> recv() override {
            if (!connected_) {
                echo::error("recv called but not connected");
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
            if (!connected_) {
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
                listening_ = false;
                echo::debug("TcpStream closed");
            }
        }

        bool is_connected() const override { return connected_; }

        dp::i32 fd() const override { return fd_; }

        Address local_address() const override { return Address::from_tcp(local_endpoint_); }

        const TcpEndpoint &remote_endpoint() const { return remote_endpoint_; }
    };

} // namespace peerwire

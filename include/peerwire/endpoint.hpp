#pragma once

#include <peerwire/common.hpp>

#include <string>

namespace peerwire {

    // Transport protocols a channel can run over
    enum class Protocol : dp::u8 {
        Tcp = 0, // BSD sockets, IPv4
        Ipc = 1  // Unix domain sockets, same host only
    };

    inline const char *protocol_name(Protocol protocol) {
        switch (protocol) {
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Ipc:
            return "ipc";
        }
        return "unknown";
    }

    inline dp::Res<Protocol> parse_protocol(const dp::String &name) {
        if (name == "tcp") {
            return dp::result::ok(Protocol::Tcp);
        }
        if (name == "ipc") {
            return dp::result::ok(Protocol::Ipc);
        }
        echo::error("unsupported protocol: ", name.c_str());
        return dp::result::err(dp::Error::invalid_argument(dp::String("unsupported protocol: ") + name));
    }

    // TCP endpoint - host and port
    // Port 0 asks the OS for an ephemeral port when listening
    struct TcpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // IPC endpoint - Unix domain socket path
    struct IpcEndpoint {
        dp::String path; // Filesystem path like /tmp/myapp.sock

        inline dp::String to_string() const { return path; }
    };

    // Transport-qualified address of a channel
    // Rendered and parsed as "tcp://host:port" or "ipc:///path/to.sock"
    struct Address {
        Protocol protocol;
        TcpEndpoint tcp; // valid for Protocol::Tcp
        IpcEndpoint ipc; // valid for Protocol::Ipc

        static Address from_tcp(const TcpEndpoint &endpoint) { return Address{Protocol::Tcp, endpoint, IpcEndpoint{}}; }

        static Address from_ipc(const IpcEndpoint &endpoint) {
            return Address{Protocol::Ipc, TcpEndpoint{"", 0}, endpoint};
        }

        inline dp::String to_uri() const {
            std::string uri = protocol_name(protocol);
            uri += "://";
            if (protocol == Protocol::Tcp) {
                uri += tcp.host.c_str();
                uri += ":";
                uri += std::to_string(tcp.port);
            } else {
                uri += ipc.path.c_str();
            }
            return dp::String(uri.c_str());
        }
    };

    inline dp::Res<Address> parse_address(const dp::String &address) {
        std::string uri(address.c_str());
        auto scheme_end = uri.find("://");
        if (scheme_end == std::string::npos) {
            echo::error("address without scheme: ", uri);
            return dp::result::err(dp::Error::invalid_argument(dp::String("address without scheme: ") + uri.c_str()));
        }

        auto protocol_res = parse_protocol(dp::String(uri.substr(0, scheme_end).c_str()));
        if (protocol_res.is_err()) {
            return dp::result::err(protocol_res.error());
        }

        std::string rest = uri.substr(scheme_end + 3);
        if (protocol_res.value() == Protocol::Ipc) {
            if (rest.empty()) {
                return dp::result::err(dp::Error::invalid_argument("ipc address without path"));
            }
            return dp::result::ok(Address::from_ipc(IpcEndpoint{dp::String(rest.c_str())}));
        }

        auto colon = rest.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
            echo::error("tcp address needs host:port: ", uri);
            return dp::result::err(dp::Error::invalid_argument(dp::String("tcp address needs host:port: ") + uri.c_str()));
        }

        std::string port_str = rest.substr(colon + 1);
        dp::u32 port = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + port_str.c_str()));
            }
            port = port * 10 + static_cast<dp::u32>(c - '0');
            if (port > 65535) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("port out of range: ") + port_str.c_str()));
            }
        }

        TcpEndpoint endpoint{dp::String(rest.substr(0, colon).c_str()), static_cast<dp::u16>(port)};
        return dp::result::ok(Address::from_tcp(endpoint));
    }

} // namespace peerwire

#pragma once

#include <peerwire/stream/ipc.hpp>
#include <peerwire/stream/tcp.hpp>

namespace peerwire {

    // Creates an unopened stream for the given transport
    inline std::unique_ptr<Stream> make_stream(Protocol protocol) {
        if (protocol == Protocol::Ipc) {
            return std::unique_ptr<Stream>(new IpcStream());
        }
        return std::unique_ptr<Stream>(new TcpStream());
    }

} // namespace peerwire

#pragma once

#include <peerwire/endpoint.hpp>

namespace peerwire {

    /// Driver construction parameters
    /// Timeouts are in milliseconds; -1 means no timeout (block forever)
    struct DriverConfig {
        dp::String protocol = "tcp";
        dp::i32 send_timeout_ms = -1;
        dp::i32 receive_timeout_ms = -1;
        dp::String host;                     // advertised IPv4 address, resolved from the host name when empty
        dp::String ipc_dir = "/tmp";         // where ipc socket files are created
        dp::usize max_pending_frames = 1024; // per inbound channel; reading pauses while the queue is full

        dp::Res<void> validate() const {
            auto protocol_res = parse_protocol(protocol);
            if (protocol_res.is_err()) {
                return dp::result::err(protocol_res.error());
            }
            if (send_timeout_ms < -1) {
                return dp::result::err(dp::Error::invalid_argument("send_timeout_ms must be >= -1"));
            }
            if (receive_timeout_ms < -1) {
                return dp::result::err(dp::Error::invalid_argument("receive_timeout_ms must be >= -1"));
            }
            if (max_pending_frames == 0) {
                return dp::result::err(dp::Error::invalid_argument("max_pending_frames must be > 0"));
            }
            return dp::result::ok();
        }
    };

} // namespace peerwire

#pragma once

#include <peerwire/common.hpp>

#include <cstring>

namespace peerwire {

    /// Driver-level error kinds
    /// Every driver operation reports failure through dp::Res; the kind travels as a
    /// stable prefix of dp::Error::message and is recovered with error_kind()
    enum class ErrorKind : dp::u8 {
        None = 0,            // not a driver error (plain transport or codec error)
        SocketType,          // unrecognized channel-kind discriminator in connect()
        PeersConnection,     // connecting to a peer's advertised address failed
        DriverReceive,       // the multiplexed wait failed
        DriverSend           // unicast/broadcast write failed or destination unknown
    };

    inline const char *error_kind_name(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::SocketType:
            return "SocketTypeError";
        case ErrorKind::PeersConnection:
            return "PeersConnectionError";
        case ErrorKind::DriverReceive:
            return "DriverReceiveError";
        case ErrorKind::DriverSend:
            return "DriverSendError";
        case ErrorKind::None:
            break;
        }
        return "";
    }

    namespace detail {
        inline dp::String tagged(ErrorKind kind, const dp::String &detail) {
            return dp::String(error_kind_name(kind)) + ": " + detail;
        }
    } // namespace detail

    inline dp::Error socket_type_error(const dp::String &detail) {
        return dp::Error::invalid_argument(detail::tagged(ErrorKind::SocketType, detail));
    }

    inline dp::Error peers_connection_error(const dp::String &peer, const dp::Error &cause) {
        return dp::Error::io_error(detail::tagged(
            ErrorKind::PeersConnection, dp::String("driver cannot connect to ") + peer + "! Due to " + cause.message));
    }

    inline dp::Error driver_receive_error(const dp::String &detail) {
        return dp::Error::io_error(detail::tagged(ErrorKind::DriverReceive, detail));
    }

    /// Send errors keep the timeout code of their cause so callers can tell backpressure from failure
    inline dp::Error driver_send_error(const dp::String &detail, bool timed_out = false) {
        if (timed_out) {
            return dp::Error::timeout(detail::tagged(ErrorKind::DriverSend, detail));
        }
        return dp::Error::io_error(detail::tagged(ErrorKind::DriverSend, detail));
    }

    inline ErrorKind error_kind(const dp::Error &error) {
        const ErrorKind kinds[] = {ErrorKind::SocketType, ErrorKind::PeersConnection, ErrorKind::DriverReceive,
                                   ErrorKind::DriverSend};
        for (ErrorKind kind : kinds) {
            const char *name = error_kind_name(kind);
            dp::usize length = std::strlen(name);
            if (error.message.size() > length && std::strncmp(error.message.c_str(), name, length) == 0 &&
                error.message.c_str()[length] == ':') {
                return kind;
            }
        }
        return ErrorKind::None;
    }

} // namespace peerwire

#pragma once

#include <peerwire/endpoint.hpp>

#include <arpa/inet.h>
#include <cstring>
#include <map>
#include <netdb.h>
#include <unistd.h>

namespace peerwire {

    /// Inbound channel kinds a peer advertises
    /// Used both as the key of the own-address map and as the discriminator of the
    /// connect-time wire format
    enum class ChannelKind : dp::u8 {
        UnicastInbound = 0,  // connect here to reach the peer directly
        BroadcastInbound = 1 // connect the broadcast channel here to make the peer a subscriber
    };

    inline const char *channel_kind_name(ChannelKind kind) {
        switch (kind) {
        case ChannelKind::UnicastInbound:
            return "unicast";
        case ChannelKind::BroadcastInbound:
            return "broadcast";
        }
        return "unknown";
    }

    /// Parses a wire discriminator; anything but "unicast"/"broadcast" is rejected
    inline dp::Res<ChannelKind> parse_channel_kind(const dp::String &name) {
        if (name == "unicast") {
            return dp::result::ok(ChannelKind::UnicastInbound);
        }
        if (name == "broadcast") {
            return dp::result::ok(ChannelKind::BroadcastInbound);
        }
        return dp::result::err(dp::Error::invalid_argument(dp::String("unrecognized channel kind ") + name));
    }

    /// Orders peer names and wire names used as map keys
    struct NameLess {
        bool operator()(const dp::String &a, const dp::String &b) const {
            return std::strcmp(a.c_str(), b.c_str()) < 0;
        }
    };

    /// Own inbound addresses: channel kind -> address URI
    using AddressMap = std::map<ChannelKind, dp::String>;

    /// Address-exchange format: channel-kind wire name -> address URI
    using WireAddressMap = std::map<dp::String, dp::String, NameLess>;

    /// What discovery hands to connect(): peer name -> wire address map
    using PeersAddressMap = std::map<dp::String, WireAddressMap, NameLess>;

    inline WireAddressMap to_wire(const AddressMap &addresses) {
        WireAddressMap wire;
        for (const auto &entry : addresses) {
            wire[channel_kind_name(entry.first)] = entry.second;
        }
        return wire;
    }

    /// IPv4 address the local host name resolves to
    inline dp::Res<dp::String> resolve_local_ip() {
        char hostname[256] = {};
        if (::gethostname(hostname, sizeof(hostname) - 1) < 0) {
            echo::error("gethostname failed: ", strerror(errno));
            return dp::result::err(dp::Error::io_error(dp::String("gethostname failed: ") + strerror(errno)));
        }

        struct addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo *result = nullptr;
        dp::i32 ret = ::getaddrinfo(hostname, nullptr, &hints, &result);
        if (ret != 0 || result == nullptr) {
            echo::error("cannot resolve host name ", hostname, ": ", gai_strerror(ret));
            return dp::result::err(dp::Error::io_error(dp::String("cannot resolve host name: ") + gai_strerror(ret)));
        }

        char ip[INET_ADDRSTRLEN] = {};
        auto *addr = reinterpret_cast<struct sockaddr_in *>(result->ai_addr);
        ::inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip));
        ::freeaddrinfo(result);

        echo::trace("host ", hostname, " resolves to ", ip);
        return dp::result::ok(dp::String(ip));
    }

    /// Records the addresses this process advertises for its inbound channels
    class AddressRegistry {
      private:
        dp::String host_;
        AddressMap addresses_;

      public:
        explicit AddressRegistry(const dp::String &host) : host_(host) {}

        const dp::String &host() const { return host_; }

        /// Records the advertised address of a bound channel
        /// TCP listeners bind the wildcard address, so the advertised host replaces it
        void record(ChannelKind kind, const Address &bound) {
            Address advertised = bound;
            if (advertised.protocol == Protocol::Tcp) {
                advertised.tcp.host = host_;
            }
            addresses_[kind] = advertised.to_uri();
            echo::trace("recorded ", channel_kind_name(kind), " address ", addresses_[kind].c_str());
        }

        const AddressMap &addresses() const { return addresses_; }

        dp::Res<dp::String> get(ChannelKind kind) const {
            auto it = addresses_.find(kind);
            if (it == addresses_.end()) {
                return dp::result::err(dp::Error::not_found(dp::String("no address for ") + channel_kind_name(kind)));
            }
            return dp::result::ok(it->second);
        }
    };

} // namespace peerwire

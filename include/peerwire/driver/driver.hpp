#pragma once

#include <peerwire/driver/config.hpp>
#include <peerwire/driver/multiplexer.hpp>
#include <peerwire/errors.hpp>
#include <peerwire/logger.hpp>
#include <peerwire/message.hpp>
#include <peerwire/metrics.hpp>

#include <algorithm>
#include <functional>

namespace peerwire {

    /// Called for every received message; return false to stop receiving
    using MessageHandler = std::function<bool(const Message &)>;

    /// Peer-to-peer messaging driver
    ///
    /// Owns four kinds of channels:
    ///   - inbound unicast: listener every peer connects to for direct delivery
    ///   - inbound broadcast: listener every peer's broadcast channel connects to
    ///   - outbound broadcast: one connection per subscribed peer, written by broadcast()
    ///   - outbound unicast: one connection per peer, written by send()
    ///
    /// Blocking and single-threaded; no internal threads. receive() may run on its own
    /// thread while connect()/send()/broadcast() run on others. Concurrent writes to the
    /// same peer, or concurrent broadcasts, need external synchronization.
    class Driver {
      private:
        DriverConfig config_;
        Protocol protocol_;
        std::shared_ptr<Logger> logger_;
        AddressRegistry registry_;
        InboundChannel unicast_receiver_;
        InboundChannel broadcast_receiver_;
        BroadcastChannel broadcast_sender_;
        PeerTable unicast_senders_;
        Multiplexer poller_;
        DriverMetrics metrics_;

        Driver(const DriverConfig &config, Protocol protocol, const dp::String &host, std::shared_ptr<Logger> logger)
            : config_(config), protocol_(protocol), logger_(std::move(logger)), registry_(host),
              unicast_receiver_(ChannelKind::UnicastInbound, protocol, config.max_pending_frames),
              broadcast_receiver_(ChannelKind::BroadcastInbound, protocol, config.max_pending_frames),
              broadcast_sender_(config.send_timeout_ms) {}

        Address bind_address() const {
            if (protocol_ == Protocol::Ipc) {
                return Address::from_ipc(IpcEndpoint{make_ipc_path(config_.ipc_dir)});
            }
            return Address::from_tcp(TcpEndpoint{"0.0.0.0", 0});
        }

        dp::Res<void> setup_channels() {
            auto unicast_res = unicast_receiver_.bind(bind_address());
            if (unicast_res.is_err()) {
                return unicast_res;
            }
            registry_.record(ChannelKind::UnicastInbound, unicast_receiver_.local_address());
            logger_->debug(dp::String("Receive message via unicasting at ") +
                           registry_.get(ChannelKind::UnicastInbound).value() + ".");

            auto broadcast_res = broadcast_receiver_.bind(bind_address());
            if (broadcast_res.is_err()) {
                return broadcast_res;
            }
            registry_.record(ChannelKind::BroadcastInbound, broadcast_receiver_.local_address());
            logger_->debug(dp::String("Subscriber message at ") + registry_.get(ChannelKind::BroadcastInbound).value() + ".");

            // Registration order matters only for reporting; precedence is decided in receive_one()
            poller_.add(unicast_receiver_);
            poller_.add(broadcast_receiver_);
            return dp::result::ok();
        }

        dp::Res<void> connect_peer(const dp::String &peer, const WireAddressMap &addresses) {
            // Validate every discriminator first so a bad entry leaves the peer untouched
            struct Entry {
                ChannelKind kind;
                Address address;
            };
            std::vector<Entry> entries;
            for (const auto &entry : addresses) {
                auto kind_res = parse_channel_kind(entry.first);
                if (kind_res.is_err()) {
                    logger_->error(dp::String("Unrecognized socket type ") + entry.first + " for " + peer + ".");
                    return dp::result::err(socket_type_error(dp::String("unrecognized socket type ") + entry.first + "."));
                }
                auto address_res = parse_address(entry.second);
                if (address_res.is_err()) {
                    return dp::result::err(peers_connection_error(peer, address_res.error()));
                }
                entries.push_back(Entry{kind_res.value(), address_res.value()});
            }

            for (const auto &entry : entries) {
                const Address &address = entry.address;

                if (entry.kind == ChannelKind::UnicastInbound) {
                    std::shared_ptr<Stream> stream(make_stream(address.protocol));
                    auto timeout_res = stream->set_send_timeout(config_.send_timeout_ms);
                    if (timeout_res.is_err()) {
                        return dp::result::err(peers_connection_error(peer, timeout_res.error()));
                    }
                    auto connect_res = stream->connect(address);
                    if (connect_res.is_err()) {
                        return dp::result::err(peers_connection_error(peer, connect_res.error()));
                    }
                    unicast_senders_.insert(peer, std::move(stream));
                    logger_->debug(dp::String("Connects to ") + peer + " via unicasting.");
                } else {
                    auto connect_res = broadcast_sender_.connect(peer, address);
                    if (connect_res.is_err()) {
                        return dp::result::err(peers_connection_error(peer, connect_res.error()));
                    }
                    logger_->debug(dp::String("Connects to ") + peer + " via broadcasting.");
                }
            }
            return dp::result::ok();
        }

      public:
        Driver(const Driver &) = delete;
        Driver &operator=(const Driver &) = delete;

        /// Binds the inbound unicast and inbound broadcast channels on OS-assigned
        /// ports and prepares the outbound broadcast channel
        /// Fails if the configuration is invalid, the host cannot be resolved or binding fails
        static dp::Res<std::unique_ptr<Driver>> create(const DriverConfig &config = DriverConfig(),
                                                       std::shared_ptr<Logger> logger = null_logger()) {
            auto valid_res = config.validate();
            if (valid_res.is_err()) {
                return dp::result::err(valid_res.error());
            }
            Protocol protocol = parse_protocol(config.protocol).value();

            dp::String host = config.host;
            if (host.empty()) {
                auto ip_res = resolve_local_ip();
                if (ip_res.is_err()) {
                    return dp::result::err(ip_res.error());
                }
                host = ip_res.value();
            }

            if (!logger) {
                logger = null_logger();
            }

            std::unique_ptr<Driver> driver(new Driver(config, protocol, host, std::move(logger)));
            auto setup_res = driver->setup_channels();
            if (setup_res.is_err()) {
                echo::error("driver setup failed: ", setup_res.error().message.c_str());
                return dp::result::err(setup_res.error());
            }
            return dp::result::ok(std::move(driver));
        }

        /// Own inbound addresses, to be handed to peers by discovery
        const AddressMap &address() const { return registry_.addresses(); }

        /// Connects to every peer in the map
        /// "unicast" entries get a dedicated outbound channel for the peer, "broadcast"
        /// entries add the peer as a subscriber of broadcast()
        /// Stops at the first failing peer; peers handled before it stay connected
        dp::Res<void> connect(const PeersAddressMap &peers_address_map) {
            for (const auto &peer : peers_address_map) {
                auto res = connect_peer(peer.first, peer.second);
                if (res.is_err()) {
                    echo::error("connect failed: ", res.error().message.c_str());
                    return res;
                }
            }
            return dp::result::ok();
        }

        /// Writes the message to the channel of message.destination
        dp::Res<void> send(const Message &message) {
            auto stream = unicast_senders_.find(message.destination);
            if (!stream) {
                metrics_.send_failures++;
                return dp::result::err(driver_send_error(
                    dp::String("Failure to send message caused by: unknown peer '") + message.destination + "'"));
            }

            Bytes frame = encode_message(message);
            auto send_res = stream->send(frame);
            if (send_res.is_err()) {
                metrics_.send_failures++;
                dp::String detail = dp::String("Failure to send message caused by: ") + send_res.error().message;
                if (!stream->is_connected()) {
                    // The peer may hold part of a frame; only a fresh connect() resynchronizes it
                    detail = detail + ", connection to " + message.destination + " lost, reconnect required";
                    logger_->warn(dp::String("Lost unicast connection to ") + message.destination + ".");
                }
                return dp::result::err(driver_send_error(detail, send_res.error().code == dp::Error::TIMEOUT));
            }

            metrics_.unicast_sent++;
            metrics_.bytes_sent += frame.size();
            logger_->debug(dp::String("Send a ") + message.tag + " message to " + message.destination + ".");
            return dp::result::ok();
        }

        /// Writes the message to every subscriber
        /// With no subscribers the message is dropped and the call succeeds
        dp::Res<void> broadcast(const Message &message) {
            Bytes frame = encode_message(message);
            auto publish_res = broadcast_sender_.publish(frame);
            if (publish_res.is_err()) {
                metrics_.send_failures++;
                return dp::result::err(driver_send_error(dp::String("Failure to broadcast message caused by: ") +
                                                             publish_res.error().message,
                                                         publish_res.error().code == dp::Error::TIMEOUT));
            }

            metrics_.broadcast_sent++;
            metrics_.bytes_sent += frame.size();
            logger_->debug(dp::String("Broadcast a ") + message.tag + " message to all subscribers.");
            return dp::result::ok();
        }

        /// Blocks until one message arrives
        /// Receive timeouts restart the wait; unicast is served before broadcast when
        /// both have data. Only a failing wait is an error.
        dp::Res<Message> receive_one() {
            while (true) {
                auto wait_res = poller_.wait(config_.receive_timeout_ms);
                if (wait_res.is_err()) {
                    metrics_.receive_errors++;
                    return dp::result::err(driver_receive_error(dp::String("Driver cannot receive message as ") +
                                                                wait_res.error().message));
                }

                const auto &ready = wait_res.value();
                bool from_unicast = std::find(ready.begin(), ready.end(), &unicast_receiver_) != ready.end();
                bool from_broadcast = std::find(ready.begin(), ready.end(), &broadcast_receiver_) != ready.end();
                if (!from_unicast && !from_broadcast) {
                    continue;
                }

                InboundChannel &channel = from_unicast ? unicast_receiver_ : broadcast_receiver_;
                auto frame_res = channel.take();
                if (frame_res.is_err()) {
                    continue;
                }
                metrics_.bytes_received += frame_res.value().size();

                auto decode_res = decode_message(frame_res.value());
                if (decode_res.is_err()) {
                    metrics_.decode_failures++;
                    logger_->warn(dp::String("Dropping undecodable frame: ") + decode_res.error().message);
                    continue;
                }

                Message message = std::move(decode_res.value());
                if (from_unicast) {
                    metrics_.unicast_received++;
                    logger_->debug(dp::String("Receive a message from ") + message.source + " through unicast receiver.");
                } else {
                    metrics_.broadcast_received++;
                    logger_->debug(dp::String("Receive a message from ") + message.source + " through broadcast receiver.");
                }
                return dp::result::ok(std::move(message));
            }
        }

        /// Hands received messages to handler
        /// continuous = false delivers exactly one message and returns, leaving any
        /// further queued messages for the next call. Otherwise runs until the handler
        /// returns false or the wait fails.
        dp::Res<void> receive(const MessageHandler &handler, bool continuous = true) {
            while (true) {
                auto message_res = receive_one();
                if (message_res.is_err()) {
                    return dp::result::err(message_res.error());
                }
                bool keep_going = handler(message_res.value());
                if (!continuous || !keep_going) {
                    return dp::result::ok();
                }
            }
        }

        /// Names of peers with an outbound unicast channel, sorted
        dp::Vector<dp::String> peers() const { return unicast_senders_.names(); }

        bool has_peer(const dp::String &peer) const { return unicast_senders_.contains(peer); }

        dp::usize subscriber_count() const { return broadcast_sender_.subscriber_count(); }

        const DriverConfig &config() const { return config_; }

        DriverMetrics &metrics() { return metrics_; }
        const DriverMetrics &metrics() const { return metrics_; }
    };

} // namespace peerwire

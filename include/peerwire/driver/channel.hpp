#pragma once

#include <peerwire/driver/address_registry.hpp>
#include <peerwire/transport.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace peerwire {

    /// Inbound side of one delivery mode
    /// A listening stream plus every connection accepted on it. Connections are read
    /// without blocking; their bytes are reassembled into frames, which are queued in
    /// arrival order until the driver takes them. While the queue holds max_pending
    /// frames nothing more is read, so the kernel buffers fill and senders see backpressure.
    class InboundChannel {
      private:
        using Clock = std::chrono::steady_clock;

        struct Connection {
            std::unique_ptr<Stream> stream;
            FrameAssembler frames;
        };

        static constexpr dp::usize READ_CHUNK = 64 * 1024;
        static constexpr dp::i32 ACCEPT_BACKOFF_MIN_MS = 10;
        static constexpr dp::i32 ACCEPT_BACKOFF_MAX_MS = 1000;

        ChannelKind kind_;
        std::unique_ptr<Stream> listener_;
        std::vector<Connection> connections_;
        std::deque<Bytes> pending_;
        dp::usize max_pending_;
        Bytes chunk_;

        dp::u32 accept_failures_ = 0;
        Clock::time_point accept_resume_{};

        // Moves complete frames of one connection into the queue, up to the cap
        void release(Connection &connection) {
            while (pending_.size() < max_pending_) {
                Bytes frame;
                auto next_res = connection.frames.next(frame);
                if (next_res.is_err()) {
                    echo::warn(channel_kind_name(kind_), " channel dropping sender fd=", connection.stream->fd(),
                               ": ", next_res.error().message.c_str());
                    connection.stream->close();
                    return;
                }
                if (!next_res.value()) {
                    return;
                }
                pending_.push_back(std::move(frame));
            }
        }

      public:
        static constexpr dp::usize DEFAULT_MAX_PENDING = 1024;

        InboundChannel(ChannelKind kind, Protocol protocol, dp::usize max_pending = DEFAULT_MAX_PENDING)
            : kind_(kind), listener_(make_stream(protocol)), max_pending_(max_pending == 0 ? 1 : max_pending),
              chunk_(READ_CHUNK) {}

        InboundChannel(const InboundChannel &) = delete;
        InboundChannel &operator=(const InboundChannel &) = delete;

        ChannelKind kind() const { return kind_; }

        dp::Res<void> bind(const Address &address) { return listener_->listen(address); }

        Address local_address() const { return listener_->local_address(); }

        dp::i32 listener_fd() const { return listener_->fd(); }

        dp::usize connection_count() const { return connections_.size(); }

        /// -1 for a closed connection whose last frames are still queued
        dp::i32 connection_fd(dp::usize index) const {
            const auto &stream = connections_[index].stream;
            return stream->is_connected() ? stream->fd() : -1;
        }

        /// False while accepting is backed off after failures
        bool accepting() const { return Clock::now() >= accept_resume_; }

        /// Milliseconds until accepting resumes, 0 when it already has
        dp::i32 accept_backoff_remaining_ms() const {
            auto now = Clock::now();
            if (now >= accept_resume_) {
                return 0;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(accept_resume_ - now).count();
            return static_cast<dp::i32>(remaining) + 1;
        }

        dp::u32 accept_failures() const { return accept_failures_; }

        /// Accepts one pending connection; the listener was reported readable
        /// A failure backs accepting off exponentially so a persistent error (EMFILE)
        /// cannot turn the receive loop into a busy loop.
        void accept_one() {
            auto accept_res = listener_->accept();
            if (accept_res.is_err()) {
                dp::i32 backoff_ms = ACCEPT_BACKOFF_MIN_MS;
                for (dp::u32 i = 0; i < accept_failures_ && backoff_ms < ACCEPT_BACKOFF_MAX_MS; ++i) {
                    backoff_ms *= 2;
                }
                backoff_ms = std::min(backoff_ms, ACCEPT_BACKOFF_MAX_MS);
                accept_resume_ = Clock::now() + std::chrono::milliseconds(backoff_ms);
                if (accept_failures_ == 0) {
                    echo::warn(channel_kind_name(kind_), " channel accept failed: ", accept_res.error().message.c_str());
                } else {
                    echo::debug(channel_kind_name(kind_), " channel accept failed again, retrying in ", backoff_ms,
                                "ms");
                }
                ++accept_failures_;
                return;
            }

            if (accept_failures_ > 0) {
                echo::info(channel_kind_name(kind_), " channel accepting again after ", accept_failures_, " failures");
            }
            accept_failures_ = 0;
            accept_resume_ = Clock::time_point{};

            auto stream = std::move(accept_res.value());
            echo::debug(channel_kind_name(kind_), " channel accepted sender fd=", stream->fd());
            connections_.push_back(Connection{std::move(stream), FrameAssembler()});
        }

        /// Reads what a connection reported readable holds and queues its complete frames
        /// A partial frame stays buffered until the rest arrives. A connection that
        /// closed, failed or broke framing is closed here and removed by prune() once
        /// its complete frames are queued.
        void read_one(dp::usize index) {
            auto &connection = connections_[index];
            auto read_res = connection.stream->read_some(chunk_.data(), chunk_.size());
            if (read_res.is_err()) {
                // Complete frames held back by the cap stay until refill() queues them
                release(connection);
                if (connection.frames.buffered() > 0 && !connection.frames.has_frame()) {
                    echo::warn(channel_kind_name(kind_), " channel sender fd=", connection.stream->fd(), " left after ",
                               connection.frames.buffered(), " bytes of an incomplete frame");
                } else {
                    echo::debug(channel_kind_name(kind_), " channel dropping sender fd=", connection.stream->fd(),
                                ": ", read_res.error().message.c_str());
                }
                connection.stream->close();
                return;
            }
            if (read_res.value() > 0) {
                connection.frames.append(chunk_.data(), read_res.value());
            }
            release(connection);
        }

        /// Queues frames already reassembled but held back by the cap
        void refill() {
            for (auto &connection : connections_) {
                if (pending_.size() >= max_pending_) {
                    return;
                }
                release(connection);
            }
        }

        /// Removes closed connections
        void prune() {
            connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                              [](const Connection &connection) {
                                                  bool closed = connection.stream->fd() < 0 ||
                                                                !connection.stream->is_connected();
                                                  return closed && !connection.frames.has_frame();
                                              }),
                               connections_.end());
        }

        /// True while the queue has room for more frames
        bool wants_data() const { return pending_.size() < max_pending_; }

        bool has_pending() const { return !pending_.empty(); }

        dp::usize pending_count() const { return pending_.size(); }

        dp::usize max_pending() const { return max_pending_; }

        /// Takes the oldest queued frame
        dp::Res<Bytes> take() {
            if (pending_.empty()) {
                return dp::result::err(dp::Error::not_found("no pending frame"));
            }
            Bytes frame = std::move(pending_.front());
            pending_.pop_front();
            return dp::result::ok(std::move(frame));
        }
    };

    /// Outbound unicast channels: peer name -> connected stream
    /// The lock only covers the table; writes on one peer's stream need external synchronization
    class PeerTable {
      private:
        std::map<dp::String, std::shared_ptr<Stream>, NameLess> peers_;
        mutable std::mutex mutex_;

      public:
        /// Inserts or replaces the channel of a peer
        void insert(const dp::String &peer, std::shared_ptr<Stream> stream) {
            std::lock_guard<std::mutex> lock(mutex_);
            peers_[peer] = std::move(stream);
        }

        std::shared_ptr<Stream> find(const dp::String &peer) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(peer);
            if (it == peers_.end()) {
                return nullptr;
            }
            return it->second;
        }

        bool contains(const dp::String &peer) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return peers_.find(peer) != peers_.end();
        }

        dp::Vector<dp::String> names() const {
            std::lock_guard<std::mutex> lock(mutex_);
            dp::Vector<dp::String> result;
            for (const auto &entry : peers_) {
                result.push_back(entry.first);
            }
            return result;
        }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return peers_.size();
        }
    };

    /// Outbound broadcast channel: one connected stream per subscriber
    class BroadcastChannel {
      private:
        struct Subscriber {
            dp::String peer;
            std::unique_ptr<Stream> stream;
        };

        std::vector<Subscriber> subscribers_;
        mutable std::mutex mutex_;
        dp::i32 send_timeout_ms_;

      public:
        explicit BroadcastChannel(dp::i32 send_timeout_ms) : send_timeout_ms_(send_timeout_ms) {}

        BroadcastChannel(const BroadcastChannel &) = delete;
        BroadcastChannel &operator=(const BroadcastChannel &) = delete;

        /// Adds a subscriber connection, replacing an earlier one of the same peer
        dp::Res<void> connect(const dp::String &peer, const Address &address) {
            auto stream = make_stream(address.protocol);
            auto timeout_res = stream->set_send_timeout(send_timeout_ms_);
            if (timeout_res.is_err()) {
                return timeout_res;
            }
            auto connect_res = stream->connect(address);
            if (connect_res.is_err()) {
                return connect_res;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &subscriber : subscribers_) {
                if (subscriber.peer == peer) {
                    subscriber.stream = std::move(stream);
                    return dp::result::ok();
                }
            }
            subscribers_.push_back(Subscriber{peer, std::move(stream)});
            return dp::result::ok();
        }

        /// Writes the frame to every subscriber
        /// Every subscriber is attempted; those whose write failed are dropped from the
        /// fan-out set and named in the returned error
        dp::Res<void> publish(const Bytes &frame) {
            std::lock_guard<std::mutex> lock(mutex_);

            dp::String failed;
            bool timed_out = false;
            std::vector<Subscriber> alive;
            for (auto &subscriber : subscribers_) {
                auto send_res = subscriber.stream->send(frame);
                if (send_res.is_err()) {
                    echo::warn("broadcast to ", subscriber.peer.c_str(), " failed: ", send_res.error().message.c_str());
                    if (!failed.empty()) {
                        failed = failed + ", ";
                    }
                    failed = failed + subscriber.peer + " (" + send_res.error().message + ")";
                    timed_out = timed_out || send_res.error().code == dp::Error::TIMEOUT;
                    continue;
                }
                alive.push_back(std::move(subscriber));
            }
            subscribers_.swap(alive);

            if (!failed.empty()) {
                if (timed_out) {
                    return dp::result::err(dp::Error::timeout(dp::String("broadcast failed for ") + failed));
                }
                return dp::result::err(dp::Error::io_error(dp::String("broadcast failed for ") + failed));
            }
            return dp::result::ok();
        }

        dp::usize subscriber_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return subscribers_.size();
        }
    };

} // namespace peerwire

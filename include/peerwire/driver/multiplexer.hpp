#pragma once

#include <peerwire/driver/channel.hpp>

#include <poll.h>
#include <vector>

namespace peerwire {

    /// Waits on several inbound channels at once
    /// One poll(2) covers every listener and every accepted connection of every
    /// registered channel. New senders are accepted and readable connections are read
    /// into their channel's queue; the caller then takes frames in whatever precedence
    /// it wants. A channel whose queue is full is not read until the caller drains it.
    class Multiplexer {
      private:
        struct Slot {
            InboundChannel *channel;
            dp::isize connection; // -1 for the listener
        };

        std::vector<InboundChannel *> channels_;

        std::vector<InboundChannel *> ready_channels() const {
            std::vector<InboundChannel *> ready;
            for (auto *channel : channels_) {
                if (channel->has_pending()) {
                    ready.push_back(channel);
                }
            }
            return ready;
        }

      public:
        /// Registration order is the order ready channels are reported in
        void add(InboundChannel &channel) { channels_.push_back(&channel); }

        dp::usize size() const { return channels_.size(); }

        /// Blocks up to timeout_ms (-1 = forever) for data on any registered channel
        /// Returns the channels holding queued frames, in registration order; an empty
        /// result means the wait timed out (or only new senders connected, or only part
        /// of a frame arrived). A failing poll(2) is the only error.
        dp::Res<std::vector<InboundChannel *>> wait(dp::i32 timeout_ms) {
            for (auto *channel : channels_) {
                channel->refill();
            }

            // With frames already queued, only pick up what the sockets hold right now
            if (!ready_channels().empty()) {
                timeout_ms = 0;
            }

            std::vector<struct pollfd> fds;
            std::vector<Slot> slots;
            for (auto *channel : channels_) {
                if (channel->listener_fd() >= 0) {
                    if (channel->accepting()) {
                        fds.push_back(pollfd{channel->listener_fd(), POLLIN, 0});
                        slots.push_back(Slot{channel, -1});
                    } else {
                        // Wake up when accepting resumes
                        dp::i32 backoff_ms = channel->accept_backoff_remaining_ms();
                        if (timeout_ms < 0 || backoff_ms < timeout_ms) {
                            timeout_ms = backoff_ms;
                        }
                    }
                }
                if (!channel->wants_data()) {
                    continue;
                }
                for (dp::usize i = 0; i < channel->connection_count(); ++i) {
                    if (channel->connection_fd(i) < 0) {
                        continue;
                    }
                    fds.push_back(pollfd{channel->connection_fd(i), POLLIN, 0});
                    slots.push_back(Slot{channel, static_cast<dp::isize>(i)});
                }
            }

            dp::i32 ret = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms < 0 ? -1 : timeout_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    echo::trace("poll interrupted by signal");
                    return dp::result::ok(ready_channels());
                }
                echo::error("poll failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("poll failed: ") + strerror(errno)));
            }
            if (ret == 0) {
                return dp::result::ok(ready_channels());
            }

            for (dp::usize i = 0; i < fds.size(); ++i) {
                if (fds[i].revents & POLLNVAL) {
                    echo::error("poll reported invalid descriptor fd=", fds[i].fd);
                    return dp::result::err(dp::Error::io_error("poll reported an invalid descriptor"));
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                if (slots[i].connection < 0) {
                    slots[i].channel->accept_one();
                } else {
                    // HUP/ERR still go through the read so the connection gets dropped
                    slots[i].channel->read_one(static_cast<dp::usize>(slots[i].connection));
                }
            }

            for (auto *channel : channels_) {
                channel->prune();
            }

            return dp::result::ok(ready_channels());
        }
    };

} // namespace peerwire

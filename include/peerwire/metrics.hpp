#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

namespace peerwire {

    /// Traffic counters of one driver
    struct DriverMetrics {
        // Outbound
        std::atomic<dp::u64> unicast_sent{0};
        std::atomic<dp::u64> broadcast_sent{0};
        std::atomic<dp::u64> send_failures{0};
        std::atomic<dp::u64> bytes_sent{0};

        // Inbound
        std::atomic<dp::u64> unicast_received{0};
        std::atomic<dp::u64> broadcast_received{0};
        std::atomic<dp::u64> decode_failures{0};
        std::atomic<dp::u64> receive_errors{0};
        std::atomic<dp::u64> bytes_received{0};

        /// Reset all metrics to zero
        inline void reset() {
            unicast_sent = 0;
            broadcast_sent = 0;
            send_failures = 0;
            bytes_sent = 0;
            unicast_received = 0;
            broadcast_received = 0;
            decode_failures = 0;
            receive_errors = 0;
            bytes_received = 0;
        }

        inline dp::u64 total_sent() const { return unicast_sent.load() + broadcast_sent.load(); }

        inline dp::u64 total_received() const { return unicast_received.load() + broadcast_received.load(); }

        /// Share of send attempts that failed (0.0 to 1.0)
        inline double send_failure_rate() const {
            dp::u64 attempts = total_sent() + send_failures.load();
            if (attempts == 0)
                return 0.0;
            return static_cast<double>(send_failures.load()) / static_cast<double>(attempts);
        }
    };

} // namespace peerwire

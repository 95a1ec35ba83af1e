#include <chrono>
#include <doctest/doctest.h>
#include <peerwire/driver/multiplexer.hpp>
#include <vector>

namespace {
    peerwire::Address any_port() { return peerwire::Address::from_tcp(peerwire::TcpEndpoint{"127.0.0.1", 0}); }

    peerwire::Address loopback(const peerwire::InboundChannel &channel) {
        return peerwire::Address::from_tcp(
            peerwire::TcpEndpoint{"127.0.0.1", channel.local_address().tcp.port});
    }

    // Waits until the channel holds at least count frames or the deadline passes
    bool drain_until(peerwire::Multiplexer &mux, peerwire::InboundChannel &channel, dp::usize count) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (channel.pending_count() < count && std::chrono::steady_clock::now() < deadline) {
            if (mux.wait(20).is_err()) {
                return false;
            }
        }
        return channel.pending_count() >= count;
    }
} // namespace

TEST_CASE("Multiplexer - timeouts") {
    peerwire::InboundChannel unicast(peerwire::ChannelKind::UnicastInbound, peerwire::Protocol::Tcp);
    REQUIRE(unicast.bind(any_port()).is_ok());
    peerwire::Multiplexer mux;
    mux.add(unicast);
    CHECK(mux.size() == 1);

    SUBCASE("No traffic yields an empty ready set after the timeout") {
        auto start = std::chrono::steady_clock::now();
        auto res = mux.wait(50);
        auto elapsed = std::chrono::steady_clock::now() - start;
        REQUIRE(res.is_ok());
        CHECK(res.value().empty());
        CHECK(elapsed >= std::chrono::milliseconds(40));
    }

    SUBCASE("A connecting sender without data is not a message") {
        peerwire::TcpStream sender;
        REQUIRE(sender.connect(loopback(unicast)).is_ok());
        auto res = mux.wait(50);
        REQUIRE(res.is_ok());
        CHECK(res.value().empty());
        CHECK_FALSE(unicast.has_pending());
    }
}

TEST_CASE("Multiplexer - frames are queued per channel") {
    peerwire::InboundChannel unicast(peerwire::ChannelKind::UnicastInbound, peerwire::Protocol::Tcp);
    peerwire::InboundChannel broadcast(peerwire::ChannelKind::BroadcastInbound, peerwire::Protocol::Tcp);
    REQUIRE(unicast.bind(any_port()).is_ok());
    REQUIRE(broadcast.bind(any_port()).is_ok());

    peerwire::Multiplexer mux;
    mux.add(unicast);
    mux.add(broadcast);

    SUBCASE("Frames from one sender stay in order") {
        peerwire::TcpStream sender;
        REQUIRE(sender.connect(loopback(unicast)).is_ok());
        for (dp::u8 i = 0; i < 5; ++i) {
            REQUIRE(sender.send(peerwire::Bytes{i}).is_ok());
        }

        REQUIRE(drain_until(mux, unicast, 5));
        for (dp::u8 i = 0; i < 5; ++i) {
            auto frame = unicast.take();
            REQUIRE(frame.is_ok());
            CHECK(frame.value()[0] == i);
        }
        CHECK(unicast.take().is_err());
    }

    SUBCASE("Both channels ready are reported in registration order") {
        peerwire::TcpStream to_unicast;
        peerwire::TcpStream to_broadcast;
        REQUIRE(to_broadcast.connect(loopback(broadcast)).is_ok());
        REQUIRE(to_unicast.connect(loopback(unicast)).is_ok());
        REQUIRE(to_broadcast.send(peerwire::Bytes{0xB}).is_ok());
        REQUIRE(to_unicast.send(peerwire::Bytes{0xA}).is_ok());

        REQUIRE(drain_until(mux, broadcast, 1));
        REQUIRE(drain_until(mux, unicast, 1));

        auto res = mux.wait(0);
        REQUIRE(res.is_ok());
        REQUIRE(res.value().size() == 2);
        CHECK(res.value()[0] == &unicast);
        CHECK(res.value()[1] == &broadcast);
    }

    SUBCASE("Queued frames cut the wait short") {
        peerwire::TcpStream sender;
        REQUIRE(sender.connect(loopback(broadcast)).is_ok());
        REQUIRE(sender.send(peerwire::Bytes{1}).is_ok());
        REQUIRE(drain_until(mux, broadcast, 1));

        auto start = std::chrono::steady_clock::now();
        auto res = mux.wait(-1);
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
        REQUIRE(res.is_ok());
        REQUIRE(res.value().size() == 1);
        CHECK(res.value()[0] == &broadcast);
    }

    SUBCASE("Closed senders are dropped") {
        {
            peerwire::TcpStream sender;
            REQUIRE(sender.connect(loopback(unicast)).is_ok());
            REQUIRE(sender.send(peerwire::Bytes{7}).is_ok());
            REQUIRE(drain_until(mux, unicast, 1));
            CHECK(unicast.connection_count() == 1);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (unicast.connection_count() > 0 && std::chrono::steady_clock::now() < deadline) {
            if (unicast.has_pending()) {
                REQUIRE(unicast.take().is_ok());
            }
            REQUIRE(mux.wait(20).is_ok());
        }
        CHECK(unicast.connection_count() == 0);
    }
}

TEST_CASE("Multiplexer - partial frames") {
    peerwire::InboundChannel unicast(peerwire::ChannelKind::UnicastInbound, peerwire::Protocol::Tcp);
    REQUIRE(unicast.bind(any_port()).is_ok());
    peerwire::Multiplexer mux;
    mux.add(unicast);

    peerwire::Bytes header;
    peerwire::append_u32_be(header, 3);
    peerwire::Bytes body = {0x1, 0x2, 0x3};

    SUBCASE("A slow sender pausing between header and body is kept") {
        peerwire::TcpStream sender;
        REQUIRE(sender.connect(loopback(unicast)).is_ok());
        REQUIRE(peerwire::write_exact(sender.fd(), header.data(), header.size()).is_ok());

        auto pause_end = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
        while (std::chrono::steady_clock::now() < pause_end) {
            REQUIRE(mux.wait(20).is_ok());
        }
        CHECK_FALSE(unicast.has_pending());
        CHECK(unicast.connection_count() == 1);

        REQUIRE(peerwire::write_exact(sender.fd(), body.data(), body.size()).is_ok());
        REQUIRE(drain_until(mux, unicast, 1));
        auto frame = unicast.take();
        REQUIRE(frame.is_ok());
        REQUIRE(frame.value().size() == 3);
        CHECK(frame.value()[2] == 0x3);
    }

    SUBCASE("A sender stuck mid-frame does not hold up others") {
        peerwire::TcpStream stuck;
        REQUIRE(stuck.connect(loopback(unicast)).is_ok());
        REQUIRE(peerwire::write_exact(stuck.fd(), header.data(), header.size()).is_ok());

        peerwire::TcpStream other;
        REQUIRE(other.connect(loopback(unicast)).is_ok());
        REQUIRE(other.send(peerwire::Bytes{0x9}).is_ok());

        REQUIRE(drain_until(mux, unicast, 1));
        auto frame = unicast.take();
        REQUIRE(frame.is_ok());
        CHECK(frame.value()[0] == 0x9);
        CHECK(unicast.connection_count() == 2);
    }

    SUBCASE("A sender leaving mid-frame is dropped without a frame") {
        {
            peerwire::TcpStream sender;
            REQUIRE(sender.connect(loopback(unicast)).is_ok());
            REQUIRE(peerwire::write_exact(sender.fd(), header.data(), header.size()).is_ok());
            REQUIRE(peerwire::write_exact(sender.fd(), body.data(), 1).is_ok());
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        do {
            REQUIRE(mux.wait(20).is_ok());
        } while (unicast.connection_count() > 0 && std::chrono::steady_clock::now() < deadline);
        CHECK(unicast.connection_count() == 0);
        CHECK_FALSE(unicast.has_pending());
    }
}

TEST_CASE("Multiplexer - bounded queue") {
    peerwire::InboundChannel unicast(peerwire::ChannelKind::UnicastInbound, peerwire::Protocol::Tcp, 2);
    REQUIRE(unicast.bind(any_port()).is_ok());
    CHECK(unicast.max_pending() == 2);
    peerwire::Multiplexer mux;
    mux.add(unicast);

    peerwire::TcpStream sender;
    REQUIRE(sender.connect(loopback(unicast)).is_ok());
    for (dp::u8 i = 0; i < 10; ++i) {
        REQUIRE(sender.send(peerwire::Bytes{i}).is_ok());
    }

    SUBCASE("The queue never grows past its cap") {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
        while (std::chrono::steady_clock::now() < deadline) {
            REQUIRE(mux.wait(20).is_ok());
            CHECK(unicast.pending_count() <= 2);
        }
        CHECK(unicast.pending_count() == 2);
        CHECK_FALSE(unicast.wants_data());
    }

    SUBCASE("Held back frames follow in order as the queue drains") {
        std::vector<dp::u8> seen;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (seen.size() < 10 && std::chrono::steady_clock::now() < deadline) {
            REQUIRE(mux.wait(20).is_ok());
            CHECK(unicast.pending_count() <= 2);
            if (unicast.has_pending()) {
                auto frame = unicast.take();
                REQUIRE(frame.is_ok());
                seen.push_back(frame.value()[0]);
            }
        }
        REQUIRE(seen.size() == 10);
        for (dp::u8 i = 0; i < 10; ++i) {
            CHECK(seen[i] == i);
        }
    }

    SUBCASE("Frames held back when the sender leaves are still delivered") {
        REQUIRE(drain_until(mux, unicast, 2));
        sender.close();

        std::vector<dp::u8> seen;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (seen.size() < 10 && std::chrono::steady_clock::now() < deadline) {
            REQUIRE(mux.wait(20).is_ok());
            while (unicast.has_pending()) {
                seen.push_back(unicast.take().value()[0]);
            }
        }
        CHECK(seen.size() == 10);
    }
}

TEST_CASE("InboundChannel - accept backoff") {
    peerwire::InboundChannel channel(peerwire::ChannelKind::UnicastInbound, peerwire::Protocol::Tcp);
    CHECK(channel.accepting());
    CHECK(channel.accept_backoff_remaining_ms() == 0);
    CHECK(channel.accept_failures() == 0);

    // Never bound, so every accept fails
    channel.accept_one();
    CHECK(channel.accept_failures() == 1);
    CHECK_FALSE(channel.accepting());
    CHECK(channel.accept_backoff_remaining_ms() > 0);
    CHECK(channel.accept_backoff_remaining_ms() <= 11);

    channel.accept_one();
    CHECK(channel.accept_failures() == 2);
    CHECK(channel.accept_backoff_remaining_ms() > 11);
    CHECK(channel.accept_backoff_remaining_ms() <= 21);

    for (int i = 0; i < 10; ++i) {
        channel.accept_one();
    }
    CHECK(channel.accept_failures() == 12);
    CHECK(channel.accept_backoff_remaining_ms() <= 1001);
    CHECK(channel.accept_backoff_remaining_ms() > 500);
    CHECK(channel.connection_count() == 0);
}

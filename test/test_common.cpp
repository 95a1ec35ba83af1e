#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <peerwire/common.hpp>
#include <peerwire/stream.hpp>

#include <sys/socket.h>

TEST_CASE("encode_u32_be") {
    auto bytes = peerwire::encode_u32_be(0x12345678);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[1] == 0x34);
    CHECK(bytes[2] == 0x56);
    CHECK(bytes[3] == 0x78);
}

TEST_CASE("decode_u32_be") {
    dp::Array<dp::u8, 4> bytes = {0x12, 0x34, 0x56, 0x78};
    CHECK(peerwire::decode_u32_be(bytes.data()) == 0x12345678);
}

TEST_CASE("append_u32_be") {
    peerwire::Bytes buffer = {0xFF};
    peerwire::append_u32_be(buffer, 0xDEADBEEF);
    REQUIRE(buffer.size() == 5);
    CHECK(buffer[0] == 0xFF);
    CHECK(buffer[1] == 0xDE);
    CHECK(buffer[4] == 0xEF);
}

TEST_CASE("to_timeval") {
    SUBCASE("Negative means block forever") {
        auto tv = peerwire::to_timeval(-1);
        CHECK(tv.tv_sec == 0);
        CHECK(tv.tv_usec == 0);
    }

    SUBCASE("Zero rounds up to one millisecond") {
        auto tv = peerwire::to_timeval(0);
        CHECK(tv.tv_sec == 0);
        CHECK(tv.tv_usec == 1000);
    }

    SUBCASE("Seconds and microseconds split") {
        auto tv = peerwire::to_timeval(2500);
        CHECK(tv.tv_sec == 2);
        CHECK(tv.tv_usec == 500000);
    }
}

TEST_CASE("read_exact / write_exact over a socket pair") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    SUBCASE("Bytes written arrive intact") {
        dp::u8 out[6] = {1, 2, 3, 4, 5, 6};
        REQUIRE(peerwire::write_exact(fds[0], out, sizeof(out)).is_ok());

        dp::u8 in[6] = {};
        REQUIRE(peerwire::read_exact(fds[1], in, sizeof(in)).is_ok());
        CHECK(in[0] == 1);
        CHECK(in[5] == 6);
    }

    SUBCASE("EOF is reported as connection closed") {
        ::close(fds[0]);
        fds[0] = -1;
        dp::u8 in[4] = {};
        auto res = peerwire::read_exact(fds[1], in, sizeof(in));
        CHECK(res.is_err());
    }

    SUBCASE("Partial write reports the bytes that reached the socket") {
        timeval tv = peerwire::to_timeval(50);
        REQUIRE(::setsockopt(fds[0], SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0);

        peerwire::Bytes big(8u * 1024u * 1024u, 0x7E);
        dp::usize written = 0;
        auto res = peerwire::write_exact(fds[0], big.data(), big.size(), written);
        REQUIRE(res.is_err());
        CHECK(res.error().code == dp::Error::TIMEOUT);
        CHECK(written > 0);
        CHECK(written < big.size());
    }

    SUBCASE("read_available returns what is there without blocking") {
        dp::u8 in[16] = {};
        auto empty = peerwire::read_available(fds[1], in, sizeof(in));
        REQUIRE(empty.is_ok());
        CHECK(empty.value() == 0);

        dp::u8 out[3] = {7, 8, 9};
        REQUIRE(peerwire::write_exact(fds[0], out, sizeof(out)).is_ok());
        auto some = peerwire::read_available(fds[1], in, sizeof(in));
        REQUIRE(some.is_ok());
        CHECK(some.value() == 3);
        CHECK(in[2] == 9);

        ::close(fds[0]);
        fds[0] = -1;
        auto closed = peerwire::read_available(fds[1], in, sizeof(in));
        REQUIRE(closed.is_err());
        CHECK(closed.error().code != dp::Error::TIMEOUT);
    }

    SUBCASE("Writing to a closed peer fails without SIGPIPE") {
        ::close(fds[1]);
        fds[1] = -1;
        dp::u8 out[4] = {1, 2, 3, 4};
        auto res = peerwire::write_exact(fds[0], out, sizeof(out));
        CHECK(res.is_err());
    }

    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
}

TEST_CASE("FrameAssembler") {
    peerwire::FrameAssembler assembler;
    peerwire::Bytes frame;

    SUBCASE("Frames split at any byte are rebuilt") {
        peerwire::Bytes wire;
        peerwire::append_u32_be(wire, 3);
        wire.push_back(0xA);
        wire.push_back(0xB);
        wire.push_back(0xC);
        peerwire::append_u32_be(wire, 0);
        peerwire::append_u32_be(wire, 1);
        wire.push_back(0xD);

        for (dp::usize i = 0; i < wire.size(); ++i) {
            assembler.append(wire.data() + i, 1);
            if (i == 2) {
                CHECK_FALSE(assembler.has_frame());
                CHECK(assembler.next(frame).value() == false);
            }
        }

        REQUIRE(assembler.has_frame());
        REQUIRE(assembler.next(frame).value());
        REQUIRE(frame.size() == 3);
        CHECK(frame[2] == 0xC);
        REQUIRE(assembler.next(frame).value());
        CHECK(frame.empty());
        REQUIRE(assembler.next(frame).value());
        CHECK(frame[0] == 0xD);
        CHECK_FALSE(assembler.next(frame).value());
        CHECK(assembler.buffered() == 0);
    }

    SUBCASE("A header without its payload stays buffered") {
        peerwire::Bytes wire;
        peerwire::append_u32_be(wire, 10);
        wire.push_back(1);
        wire.push_back(2);
        wire.push_back(3);
        assembler.append(wire.data(), wire.size());
        CHECK_FALSE(assembler.has_frame());
        CHECK_FALSE(assembler.next(frame).value());
        CHECK(assembler.buffered() == 7);
    }

    SUBCASE("Oversized length prefix is an error") {
        peerwire::Bytes wire;
        peerwire::append_u32_be(wire, peerwire::MAX_FRAME_SIZE + 1);
        assembler.append(wire.data(), wire.size());
        CHECK_FALSE(assembler.has_frame());
        CHECK(assembler.next(frame).is_err());
    }
}

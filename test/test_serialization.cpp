#include <doctest/doctest.h>
#include <peerwire/serialization.hpp>

namespace {
    struct Pose {
        double x;
        double y;
        dp::i32 frame;
    };
} // namespace

namespace peerwire {
    template <> struct Serializer<Pose> : TrivialSerializer<Pose> {};
} // namespace peerwire

TEST_CASE("Serializer - built-in types") {
    SUBCASE("std::string") {
        auto bytes = peerwire::Serializer<std::string>::serialize("hello");
        CHECK(bytes.size() == 5);
        CHECK(peerwire::Serializer<std::string>::deserialize(bytes).value() == "hello");
    }

    SUBCASE("dp::String") {
        auto bytes = peerwire::Serializer<dp::String>::serialize(dp::String("peer-7"));
        CHECK(bytes.size() == 6);
        CHECK(peerwire::Serializer<dp::String>::deserialize(bytes).value() == "peer-7");
    }

    SUBCASE("Integers and floats") {
        auto bytes = peerwire::Serializer<dp::u64>::serialize(0x0102030405060708ull);
        CHECK(bytes.size() == 8);
        CHECK(peerwire::Serializer<dp::u64>::deserialize(bytes).value() == 0x0102030405060708ull);

        auto d = peerwire::Serializer<double>::serialize(3.25);
        CHECK(peerwire::Serializer<double>::deserialize(d).value() == doctest::Approx(3.25));
    }

    SUBCASE("bool") {
        CHECK(peerwire::Serializer<bool>::deserialize(peerwire::Serializer<bool>::serialize(true)).value());
        CHECK(peerwire::Serializer<bool>::deserialize(peerwire::Bytes{0, 1}).is_err());
    }

    SUBCASE("Size mismatch is an error") {
        peerwire::Bytes three = {1, 2, 3};
        CHECK(peerwire::Serializer<dp::u32>::deserialize(three).is_err());
    }
}

TEST_CASE("Serializer - typed message payloads") {
    auto message = peerwire::make_message("agent", "env", "pose", Pose{1.5, -2.0, 42});
    CHECK(message.source == "agent");
    CHECK(message.destination == "env");
    CHECK(message.tag == "pose");
    CHECK(message.payload.size() == sizeof(Pose));

    auto pose = peerwire::payload_as<Pose>(message);
    REQUIRE(pose.is_ok());
    CHECK(pose.value().x == doctest::Approx(1.5));
    CHECK(pose.value().y == doctest::Approx(-2.0));
    CHECK(pose.value().frame == 42);

    CHECK(peerwire::payload_as<dp::u8>(message).is_err());
}

#pragma once

#include <peerwire/message.hpp>
#include <cstring>
#include <string>
#include <type_traits>

namespace peerwire {

    /// Serializer interface - convert a payload value of type T to/from Bytes
    template <typename T> struct Serializer {
        static Bytes serialize(const T &value);
        static dp::Res<T> deserialize(const Bytes &bytes);
    };

    /// Default serializer for trivially copyable types (POD types)
    template <typename T> struct TrivialSerializer {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");

        static Bytes serialize(const T &value) {
            const dp::u8 *bytes = reinterpret_cast<const dp::u8 *>(&value);
            return Bytes(bytes, bytes + sizeof(T));
        }

        static dp::Res<T> deserialize(const Bytes &bytes) {
            if (bytes.size() != sizeof(T)) {
                echo::error("deserialize size mismatch: expected ", sizeof(T), " got ", bytes.size());
                return dp::result::err(dp::Error::invalid_argument("size mismatch"));
            }
            T value;
            std::memcpy(&value, bytes.data(), sizeof(T));
            return dp::result::ok(value);
        }
    };

    template <> struct Serializer<std::string> {
        static Bytes serialize(const std::string &value) { return Bytes(value.begin(), value.end()); }

        static dp::Res<std::string> deserialize(const Bytes &bytes) {
            return dp::result::ok(std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
        }
    };

    template <> struct Serializer<dp::String> {
        static Bytes serialize(const dp::String &value) {
            const dp::u8 *bytes = reinterpret_cast<const dp::u8 *>(value.c_str());
            return Bytes(bytes, bytes + value.size());
        }

        static dp::Res<dp::String> deserialize(const Bytes &bytes) {
            return dp::result::ok(dp::String(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
        }
    };

    template <> struct Serializer<dp::u8> : TrivialSerializer<dp::u8> {};
    template <> struct Serializer<dp::u16> : TrivialSerializer<dp::u16> {};
    template <> struct Serializer<dp::u32> : TrivialSerializer<dp::u32> {};
    template <> struct Serializer<dp::u64> : TrivialSerializer<dp::u64> {};
    template <> struct Serializer<dp::i8> : TrivialSerializer<dp::i8> {};
    template <> struct Serializer<dp::i16> : TrivialSerializer<dp::i16> {};
    template <> struct Serializer<dp::i32> : TrivialSerializer<dp::i32> {};
    template <> struct Serializer<dp::i64> : TrivialSerializer<dp::i64> {};
    template <> struct Serializer<float> : TrivialSerializer<float> {};
    template <> struct Serializer<double> : TrivialSerializer<double> {};

    template <> struct Serializer<bool> {
        static Bytes serialize(const bool &value) { return Bytes{value ? dp::u8(1) : dp::u8(0)}; }

        static dp::Res<bool> deserialize(const Bytes &bytes) {
            if (bytes.size() != 1) {
                return dp::result::err(dp::Error::invalid_argument("bool size must be 1"));
            }
            return dp::result::ok(bytes[0] != 0);
        }
    };

    /// Builds a message whose payload is the serialized value
    template <typename T>
    Message make_message(const dp::String &source, const dp::String &destination, const dp::String &tag,
                         const T &value) {
        return Message{source, destination, tag, Serializer<T>::serialize(value)};
    }

    /// Decodes a message payload as T
    template <typename T> dp::Res<T> payload_as(const Message &message) {
        return Serializer<T>::deserialize(message.payload);
    }

} // namespace peerwire

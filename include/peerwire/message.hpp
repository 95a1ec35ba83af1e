#pragma once

#include <peerwire/common.hpp>

#include <algorithm>

namespace peerwire {

    /// Structured message exchanged between peers
    /// The driver treats it as an opaque value; routing by tag/destination belongs to the caller
    struct Message {
        dp::String source;      // name of the sending peer
        dp::String destination; // receiving peer for unicast, empty for broadcast
        dp::String tag;         // kind discriminator
        Bytes payload;

        friend bool operator==(const Message &a, const Message &b) {
            return a.source == b.source && a.destination == b.destination && a.tag == b.tag &&
                   a.payload.size() == b.payload.size() &&
                   std::equal(a.payload.begin(), a.payload.end(), b.payload.begin());
        }

        friend bool operator!=(const Message &a, const Message &b) { return !(a == b); }
    };

    /// Codec version
    /// Format: [version:1][source_len:4][source][destination_len:4][destination][tag_len:4][tag][payload_len:4][payload]
    /// All lengths are big-endian
    constexpr dp::u8 CODEC_VERSION = 1;

    namespace detail {

        inline void append_field(Bytes &out, const dp::u8 *data, dp::usize size) {
            append_u32_be(out, static_cast<dp::u32>(size));
            out.insert(out.end(), data, data + size);
        }

        inline void append_field(Bytes &out, const dp::String &value) {
            append_field(out, reinterpret_cast<const dp::u8 *>(value.c_str()), value.size());
        }

        struct FieldSpan {
            dp::usize offset;
            dp::usize length;
        };

        // Reads one length-prefixed field starting at offset, advancing it
        inline dp::Res<FieldSpan> read_field(const Bytes &in, dp::usize &offset) {
            if (in.size() - offset < 4) {
                return dp::result::err(dp::Error::invalid_argument("truncated field length"));
            }
            dp::u32 length = decode_u32_be(in.data() + offset);
            offset += 4;
            if (in.size() - offset < length) {
                echo::error("field length ", length, " exceeds remaining ", in.size() - offset, " bytes");
                return dp::result::err(dp::Error::invalid_argument("truncated field"));
            }
            FieldSpan span{offset, length};
            offset += length;
            return dp::result::ok(span);
        }

        inline dp::Res<dp::String> read_string(const Bytes &in, dp::usize &offset) {
            auto span_res = read_field(in, offset);
            if (span_res.is_err()) {
                return dp::result::err(span_res.error());
            }
            auto span = span_res.value();
            return dp::result::ok(dp::String(reinterpret_cast<const char *>(in.data()) + span.offset, span.length));
        }

    } // namespace detail

    inline Bytes encode_message(const Message &message) {
        Bytes out;
        out.push_back(CODEC_VERSION);
        detail::append_field(out, message.source);
        detail::append_field(out, message.destination);
        detail::append_field(out, message.tag);
        detail::append_field(out, message.payload.data(), message.payload.size());
        return out;
    }

    inline dp::Res<Message> decode_message(const Bytes &frame) {
        if (frame.empty()) {
            return dp::result::err(dp::Error::invalid_argument("empty frame"));
        }
        if (frame[0] != CODEC_VERSION) {
            echo::error("unsupported codec version: ", static_cast<int>(frame[0]));
            return dp::result::err(dp::Error::invalid_argument("unsupported codec version"));
        }

        dp::usize offset = 1;
        Message message;

        auto source = detail::read_string(frame, offset);
        if (source.is_err()) {
            return dp::result::err(source.error());
        }
        auto destination = detail::read_string(frame, offset);
        if (destination.is_err()) {
            return dp::result::err(destination.error());
        }
        auto tag = detail::read_string(frame, offset);
        if (tag.is_err()) {
            return dp::result::err(tag.error());
        }
        auto payload = detail::read_field(frame, offset);
        if (payload.is_err()) {
            return dp::result::err(payload.error());
        }

        if (offset != frame.size()) {
            echo::error("trailing bytes after message: ", frame.size() - offset);
            return dp::result::err(dp::Error::invalid_argument("trailing bytes after message"));
        }

        message.source = source.value();
        message.destination = destination.value();
        message.tag = tag.value();
        auto span = payload.value();
        message.payload = Bytes(frame.begin() + span.offset, frame.begin() + span.offset + span.length);
        return dp::result::ok(std::move(message));
    }

} // namespace peerwire

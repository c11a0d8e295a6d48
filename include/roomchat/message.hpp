#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "types.hpp"

namespace roomchat {

/// Preview of the message being replied to, carried inside the reply.
struct ReplyPreview {
    std::string id;
    std::string sender;
    std::string content;  // truncated copy of the replied-to content

    bool operator==(const ReplyPreview& other) const {
        return id == other.id && sender == other.sender && content == other.content;
    }
    bool operator!=(const ReplyPreview& other) const { return !(*this == other); }
};

struct ChatMessage {
    std::string id;
    std::string sender;  // self-asserted display name
    std::string content;
    uint64_t timestamp = 0;  // unix epoch milliseconds
    std::optional<ReplyPreview> reply_to;

    bool operator==(const ChatMessage& other) const {
        return id == other.id && sender == other.sender && content == other.content &&
               timestamp == other.timestamp && reply_to == other.reply_to;
    }
    bool operator!=(const ChatMessage& other) const { return !(*this == other); }
};

namespace message {

    /// Field size limits, in bytes.  Applied on both encode and decode.
    inline constexpr size_t MAX_ID_LENGTH = 128;
    inline constexpr size_t MAX_SENDER_LENGTH = 256;
    inline constexpr size_t MAX_CONTENT_LENGTH = 16 * 1024;

    /// Default length, in UTF-16 code units, of the replied-to content kept in a ReplyPreview.
    inline constexpr size_t REPLY_PREVIEW_CHARS = 50;

    /// Thrown (or returned, by try_decode) when a payload is not a valid chat message.
    struct decode_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /// Either a fully valid message or the reason the payload was rejected.
    using decode_result = std::variant<ChatMessage, decode_error>;

    /// API: message/validate
    ///
    /// Throws std::invalid_argument if the message has an empty id, a field over its size limit,
    /// or a string field that is not valid UTF-8.
    void validate(const ChatMessage& msg);

    /// API: message/encode
    ///
    /// Serializes a message to the protobuf wire form (fields 1-4, plus field 5 when the message
    /// is a reply).
    ///
    /// Throws std::invalid_argument if the message has an empty id, a field over its size limit,
    /// or a string field that is not valid UTF-8.
    ustring encode(const ChatMessage& msg);

    /// API: message/decode
    ///
    /// Parses a wire payload.  All of timestamp, sender, content and messageId must be present;
    /// unknown fields are ignored.  Throws decode_error on any malformed payload; a partially
    /// valid message is never returned.
    ChatMessage decode(ustring_view data);

    /// API: message/try_decode
    ///
    /// Same as `decode`, but returns the failure as a value instead of throwing.
    decode_result try_decode(ustring_view data);

    /// API: message/generate_id
    ///
    /// Returns a new message id of the form `<timestamp_ms>-<16 random hex digits>`.
    std::string generate_id(uint64_t timestamp_ms);

    /// API: message/make_reply_preview
    ///
    /// Builds the preview embedded in a reply to `target`: content is cut to `max_units` UTF-16
    /// code units with "..." appended when anything was cut.  Other clients measure previews in
    /// UTF-16 units, so counting the same way keeps previews of emoji-heavy messages identical.
    /// A code point that would only half fit is dropped rather than split.
    ReplyPreview make_reply_preview(
            const ChatMessage& target, size_t max_units = REPLY_PREVIEW_CHARS);

    /// Marker opening the textual reply prefix used by peers that predate the structured
    /// replyTo field ("↩️ ").
    inline constexpr std::string_view LEGACY_REPLY_MARKER = "\xE2\x86\xA9\xEF\xB8\x8F ";

    /// API: message/compose_legacy_reply
    ///
    /// Returns `content` with the textual reply prefix prepended:
    ///
    ///     ↩️ <sender>: "<preview>"\n\n<content>
    std::string compose_legacy_reply(const ReplyPreview& reply, std::string_view content);

    /// API: message/parse_legacy_reply
    ///
    /// If `content` starts with a well-formed textual reply prefix, returns the preview it
    /// describes (with an empty id) and the remaining content.  Returns nullopt otherwise.  The
    /// replied-to message can be found again by comparing the preview with `make_reply_preview`
    /// of each candidate, since both cut at the same UTF-16 length.
    ///
    /// The convention is inherently ambiguous: content that happens to begin with the marker
    /// sequence is indistinguishable from a reply.
    std::optional<std::pair<ReplyPreview, std::string>> parse_legacy_reply(
            std::string_view content);

}  // namespace message

}  // namespace roomchat

#include "roomchat/message.hpp"

#include <oxenc/hex.h>

#include <iterator>
#include <stdexcept>

#include "RoomChatProtos.pb.h"
#include "roomchat/random.hpp"
#include "roomchat/util.hpp"

using namespace std::literals;

namespace roomchat::message {

namespace {

    void check_field(std::string_view name, std::string_view value, size_t max_len) {
        if (value.size() > max_len)
            throw std::invalid_argument{
                    "Invalid message " + std::string{name} + ": expected at most " +
                    std::to_string(max_len) + " bytes; got " + std::to_string(value.size())};
        if (!is_utf8(value))
            throw std::invalid_argument{
                    "Invalid message " + std::string{name} + ": not valid UTF-8"};
    }

}  // namespace

void validate(const ChatMessage& msg) {
    if (msg.id.empty())
        throw std::invalid_argument{"Invalid message id: id is empty"};
    check_field("id", msg.id, MAX_ID_LENGTH);
    check_field("sender", msg.sender, MAX_SENDER_LENGTH);
    check_field("content", msg.content, MAX_CONTENT_LENGTH);
    if (msg.reply_to) {
        check_field("reply id", msg.reply_to->id, MAX_ID_LENGTH);
        check_field("reply sender", msg.reply_to->sender, MAX_SENDER_LENGTH);
        check_field("reply content", msg.reply_to->content, MAX_CONTENT_LENGTH);
    }
}

ustring encode(const ChatMessage& msg) {
    validate(msg);

    RoomChatProtos::InstantRoomChatMessage pb;
    pb.set_timestamp(msg.timestamp);
    pb.set_sender(msg.sender);
    pb.set_content(msg.content);
    pb.set_messageid(msg.id);
    if (msg.reply_to) {
        auto* reply = pb.mutable_replyto();
        reply->set_id(msg.reply_to->id);
        reply->set_sender(msg.reply_to->sender);
        reply->set_content(msg.reply_to->content);
    }

    std::string output = pb.SerializeAsString();
    return {to_unsigned(output.data()), output.size()};
}

ChatMessage decode(ustring_view data) {
    RoomChatProtos::InstantRoomChatMessage pb;
    if (!pb.ParseFromArray(data.data(), static_cast<int>(data.size())))
        throw decode_error{"Invalid chat message: payload is not a valid protobuf message"};

    if (!pb.has_timestamp() || !pb.has_sender() || !pb.has_content() || !pb.has_messageid())
        throw decode_error{"Invalid chat message: missing one or more required fields"};

    ChatMessage msg;
    msg.id = pb.messageid();
    msg.sender = pb.sender();
    msg.content = pb.content();
    msg.timestamp = pb.timestamp();
    if (pb.has_replyto()) {
        const auto& reply = pb.replyto();
        msg.reply_to.emplace();
        msg.reply_to->id = reply.id();
        msg.reply_to->sender = reply.sender();
        msg.reply_to->content = reply.content();
    }

    try {
        validate(msg);
    } catch (const std::invalid_argument& e) {
        throw decode_error{e.what()};
    }
    return msg;
}

decode_result try_decode(ustring_view data) {
    try {
        return decode(data);
    } catch (const decode_error& e) {
        return e;
    }
}

std::string generate_id(uint64_t timestamp_ms) {
    auto rand = random::random(8);
    std::string id = std::to_string(timestamp_ms);
    id += '-';
    oxenc::to_hex(rand.begin(), rand.end(), std::back_inserter(id));
    return id;
}

ReplyPreview make_reply_preview(const ChatMessage& target, size_t max_units) {
    ReplyPreview preview;
    preview.id = target.id;
    preview.sender = target.sender;
    auto cut = utf16_truncate(target.content, max_units);
    preview.content = cut;
    if (cut.size() < target.content.size())
        preview.content += "...";
    return preview;
}

static constexpr auto LEGACY_SENDER_END = ": \""sv;
static constexpr auto LEGACY_PREVIEW_END = "\"\n\n"sv;

std::string compose_legacy_reply(const ReplyPreview& reply, std::string_view content) {
    std::string result;
    result.reserve(
            LEGACY_REPLY_MARKER.size() + reply.sender.size() + LEGACY_SENDER_END.size() +
            reply.content.size() + LEGACY_PREVIEW_END.size() + content.size());
    result += LEGACY_REPLY_MARKER;
    result += reply.sender;
    result += LEGACY_SENDER_END;
    result += reply.content;
    result += LEGACY_PREVIEW_END;
    result += content;
    return result;
}

std::optional<std::pair<ReplyPreview, std::string>> parse_legacy_reply(std::string_view content) {
    if (!starts_with(content, LEGACY_REPLY_MARKER))
        return std::nullopt;
    content.remove_prefix(LEGACY_REPLY_MARKER.size());

    auto sender_end = content.find(LEGACY_SENDER_END);
    if (sender_end == std::string_view::npos)
        return std::nullopt;
    auto rest = content.substr(sender_end + LEGACY_SENDER_END.size());

    auto preview_end = rest.find(LEGACY_PREVIEW_END);
    if (preview_end == std::string_view::npos)
        return std::nullopt;

    ReplyPreview reply;
    reply.sender = content.substr(0, sender_end);
    reply.content = rest.substr(0, preview_end);
    return std::make_pair(
            std::move(reply), std::string{rest.substr(preview_end + LEGACY_PREVIEW_END.size())});
}

}  // namespace roomchat::message

#include "roomchat/chat_session.hpp"

#include <stdexcept>

#include "roomchat/util.hpp"

using namespace std::literals;

namespace roomchat {

namespace {

    // The message as it goes on the wire: with the legacy option, a reply's content also carries
    // the textual reply prefix.
    ChatMessage wire_form(const ChatMessage& msg, bool legacy_reply_prefix) {
        if (!legacy_reply_prefix || !msg.reply_to)
            return msg;
        ChatMessage wire = msg;
        wire.content = message::compose_legacy_reply(*msg.reply_to, msg.content);
        return wire;
    }

    std::string check_display_name(std::string_view name) {
        name = trim(name);
        if (name.empty())
            throw std::invalid_argument{"Invalid display name: name is empty"};
        if (name.size() > message::MAX_SENDER_LENGTH)
            throw std::invalid_argument{
                    "Invalid display name: expected at most " +
                    std::to_string(message::MAX_SENDER_LENGTH) + " bytes"};
        if (!is_utf8(name))
            throw std::invalid_argument{"Invalid display name: not valid UTF-8"};
        return std::string{name};
    }

}  // namespace

ChatSession::ChatSession(
        std::string_view room_code,
        std::string_view display_name,
        network::relay_factory factory,
        SessionOptions options) :
        room_code_{room::canonical_code(room_code)},
        topic_{room::content_topic(room_code_)},
        display_name_{check_display_name(display_name)},
        options_{options} {
    sodium_cleared<room::Key> key{room::derive_key(room_code_)};
    client_ = std::make_unique<network::NetworkClient>(
            topic_, key, std::move(factory), options_.connect_timeout);

    client_->logger = [this](LogLevel lvl, std::string msg) { log(lvl, std::move(msg)); };
    client_->on_state_change([this](ConnectionState state, std::string error) {
        handle_state(state, std::move(error));
    });
    client_->on_message([this](ChatMessage msg) { handle_message(std::move(msg)); });
}

ChatSession::~ChatSession() {
    client_->teardown();
}

void ChatSession::queue_events(pending_events ev) {
    if (ev.messages || ev.unread || ev.notify || !ev.send_status.empty())
        events_.push_back(std::move(ev));
}

void ChatSession::dispatch() {
    std::unique_lock lock{mutex_};
    // Another thread (or an outer frame of this one) is already delivering; it picks up whatever we
    // queued once its current hook returns.
    if (dispatching_)
        return;
    dispatching_ = true;
    while (!events_.empty()) {
        auto ev = std::move(events_.front());
        events_.pop_front();
        lock.unlock();
        fire(std::move(ev));
        lock.lock();
    }
    dispatching_ = false;
}

void ChatSession::fire(pending_events ev) {
    if (ev.messages)
        invoke("messages"sv, messages_hook_, std::move(*ev.messages));
    for (auto& [id, status] : ev.send_status)
        invoke("send status"sv, send_status_hook_, id, status);
    if (ev.unread)
        invoke("unread"sv, unread_hook_, *ev.unread);
    if (ev.notify) {
        // The session may have been opened while the earlier hooks ran
        bool open;
        {
            std::lock_guard lock{mutex_};
            open = open_;
        }
        if (!open)
            invoke("notify"sv, notify_hook_, ev.notify->first, ev.notify->second);
    }
}

void ChatSession::connect() {
    log(LogLevel::info, "Joining room " + room_code_ + " as " + display_name_);
    client_->connect();
}

bool ChatSession::retry() {
    auto state = client_->state();
    if (state != ConnectionState::error && state != ConnectionState::disconnected)
        return false;
    client_->connect();
    return true;
}

void ChatSession::open() {
    pending_events ev;
    {
        std::lock_guard lock{mutex_};
        if (open_)
            return;
        open_ = true;
        unread_ = 0;
        ev.unread = 0;
        queue_events(std::move(ev));
    }
    dispatch();
}

void ChatSession::close() {
    std::lock_guard lock{mutex_};
    open_ = false;
}

void ChatSession::leave() {
    client_->teardown();

    size_t abandoned;
    {
        std::lock_guard lock{mutex_};
        pending_events ev;
        for (auto& id : transcript_.fail_pending())
            ev.send_status.emplace_back(std::move(id), SendStatus::failed);
        abandoned = ev.send_status.size();
        if (abandoned)
            ev.messages = transcript_.entries();
        queue_events(std::move(ev));
    }
    if (abandoned)
        log(LogLevel::info,
            "Left room with " + std::to_string(abandoned) + " unsent message(s)");
    dispatch();
}

void ChatSession::handle_state(ConnectionState state, std::string error) {
    invoke("connection state"sv, state_hook_, state, std::move(error));
}

void ChatSession::handle_message(ChatMessage msg) {
    std::optional<std::pair<ReplyPreview, std::string>> legacy;
    if (options_.legacy_reply_prefix)
        legacy = message::parse_legacy_reply(msg.content);

    auto id = msg.id;
    auto sender = msg.sender;
    pending_events ev;
    {
        std::lock_guard lock{mutex_};
        if (transcript_.seen(id)) {
            // Relay duplicate, or the echo of one of our own messages
            return;
        }

        if (legacy) {
            msg.content = std::move(legacy->second);
            if (!msg.reply_to) {
                // The prefix carries no id; recover it from the transcript where we can.
                auto& reply = legacy->first;
                for (auto& e : transcript_.entries()) {
                    if (e.message.sender != reply.sender)
                        continue;
                    auto preview = message::make_reply_preview(
                            e.message, options_.reply_preview_chars);
                    if (preview.content == reply.content) {
                        reply.id = e.message.id;
                        break;
                    }
                }
                msg.reply_to = std::move(reply);
            }
        }

        transcript_.add_incoming(std::move(msg));
        ev.messages = transcript_.entries();

        if (sender != display_name_ && !open_) {
            ev.unread = ++unread_;
            ev.notify.emplace(sender, id);
        }
        queue_events(std::move(ev));
    }

    log(LogLevel::debug, "Message " + id + " from " + sender + " added to transcript");
    dispatch();
}

std::string ChatSession::send_message(
        std::string_view text, std::optional<std::string_view> reply_to) {
    auto body = trim(text);
    if (body.empty())
        throw std::invalid_argument{"Cannot send an empty message"};

    ChatMessage msg;
    msg.timestamp = get_timestamp_ms();
    msg.id = message::generate_id(msg.timestamp);
    msg.sender = display_name_;
    msg.content = body;

    pending_events ev;
    {
        std::lock_guard lock{mutex_};
        if (reply_to) {
            auto* target = transcript_.find(*reply_to);
            if (!target)
                throw std::invalid_argument{
                        "Cannot reply to unknown message " + std::string{*reply_to}};
            msg.reply_to =
                    message::make_reply_preview(target->message, options_.reply_preview_chars);
        }

        message::validate(wire_form(msg, options_.legacy_reply_prefix));

        transcript_.add_outgoing(msg);
        ev.messages = transcript_.entries();
        queue_events(std::move(ev));
    }
    dispatch();

    publish(msg);
    return msg.id;
}

bool ChatSession::resend(std::string_view message_id) {
    ChatMessage msg;
    pending_events ev;
    {
        std::lock_guard lock{mutex_};
        auto* entry = transcript_.find(message_id);
        if (!entry || !entry->outgoing || entry->status != SendStatus::failed)
            return false;
        msg = entry->message;
        transcript_.set_status(message_id, SendStatus::pending);
        ev.messages = transcript_.entries();
        ev.send_status.emplace_back(msg.id, SendStatus::pending);
        queue_events(std::move(ev));
    }
    log(LogLevel::info, "Resending message " + msg.id);
    dispatch();

    publish(msg);
    return true;
}

void ChatSession::publish(const ChatMessage& msg) {
    client_->publish(
            wire_form(msg, options_.legacy_reply_prefix),
            [this, id = msg.id](bool success, std::string error) {
                handle_publish_result(id, success, std::move(error));
            });
}

void ChatSession::handle_publish_result(const std::string& id, bool success, std::string error) {
    auto status = success ? SendStatus::sent : SendStatus::failed;
    pending_events ev;
    {
        std::lock_guard lock{mutex_};
        auto* entry = transcript_.find(id);
        // Ignore outcomes that arrive after leave() already gave up on the message
        if (!entry || !entry->outgoing || entry->status != SendStatus::pending)
            return;
        transcript_.set_status(id, status);
        ev.messages = transcript_.entries();
        ev.send_status.emplace_back(id, status);
        queue_events(std::move(ev));
    }
    if (!success)
        log(LogLevel::warning, "Message " + id + " was not sent: " + error);
    dispatch();
}

bool ChatSession::toggle_reaction(const std::string& message_id, std::string_view emoji) {
    std::lock_guard lock{mutex_};
    if (!transcript_.find(message_id))
        throw std::invalid_argument{"Cannot react to unknown message " + message_id};
    return reactions_.toggle(message_id, emoji, display_name_);
}

std::vector<TranscriptEntry> ChatSession::messages() const {
    std::lock_guard lock{mutex_};
    return transcript_.entries();
}

std::optional<TranscriptEntry> ChatSession::message(std::string_view id) const {
    std::lock_guard lock{mutex_};
    if (auto* entry = transcript_.find(id))
        return *entry;
    return std::nullopt;
}

std::vector<Reaction> ChatSession::reactions(const std::string& message_id) const {
    std::lock_guard lock{mutex_};
    return reactions_.get(message_id);
}

ConnectionState ChatSession::connection_state() const {
    return client_->state();
}

std::string ChatSession::last_error() const {
    return client_->last_error();
}

int ChatSession::unread() const {
    std::lock_guard lock{mutex_};
    return unread_;
}

bool ChatSession::is_open() const {
    std::lock_guard lock{mutex_};
    return open_;
}

}  // namespace roomchat

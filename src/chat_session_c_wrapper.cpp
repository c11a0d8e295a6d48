#include <cassert>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "roomchat/chat_session.h"
#include "roomchat/chat_session.hpp"
#include "roomchat/export.h"
#include "roomchat/relay.hpp"
#include "roomchat/util.hpp"

using namespace std::literals;
using namespace roomchat;

namespace {

using publish_fn = bool (*)(const char*, const unsigned char*, size_t, void*);

class HookRelayNode;

// Relay backed by the embedder: publishing calls out to a C function, peer readiness and received
// payloads are pushed in through the C API.  Only one node (the session's current one) is
// subscribed at a time.
class HookRelay : public std::enable_shared_from_this<HookRelay> {
  public:
    HookRelay(publish_fn publish, void* ctx) : publish_{publish}, ctx_{ctx} {}

    std::unique_ptr<network::RelayNode> make_node();

    void set_peers_ready(bool ready) {
        {
            std::lock_guard lock{mutex_};
            peers_ready_ = ready;
        }
        cv_.notify_all();
    }

    void receive(ustring_view payload) {
        std::lock_guard dlock{deliver_mutex_};
        network::payload_handler handler;
        {
            std::lock_guard lock{mutex_};
            handler = handler_;
        }
        if (handler)
            handler(ustring{payload});
    }

  private:
    friend class HookRelayNode;

    publish_fn publish_;
    void* ctx_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool peers_ready_ = false;

    // Held while a handler runs so that unsubscribing waits out an in-flight delivery
    std::recursive_mutex deliver_mutex_;
    const HookRelayNode* subscriber_ = nullptr;
    network::payload_handler handler_;
};

class HookRelayNode : public network::RelayNode {
  public:
    explicit HookRelayNode(std::shared_ptr<HookRelay> relay) : relay_{std::move(relay)} {}
    ~HookRelayNode() override { stop(); }

    void start() override {}

    bool wait_for_peers(
            const std::vector<network::Protocol>& /*protocols*/,
            std::chrono::milliseconds timeout) override {
        std::unique_lock lock{relay_->mutex_};
        relay_->cv_.wait_for(lock, timeout, [this] { return stopped_ || relay_->peers_ready_; });
        return !stopped_ && relay_->peers_ready_;
    }

    void subscribe(const std::string& topic, network::payload_handler handler) override {
        std::lock_guard lock{relay_->mutex_};
        if (stopped_)
            throw std::runtime_error{"Cannot subscribe: relay node is not running"};
        topic_ = topic;
        relay_->subscriber_ = this;
        relay_->handler_ = std::move(handler);
    }

    void unsubscribe(const std::string& topic) override {
        if (topic == topic_)
            drop_subscription();
    }

    void publish(
            const std::string& topic, ustring payload, network::publish_callback done) override {
        bool ready;
        {
            std::lock_guard lock{relay_->mutex_};
            ready = !stopped_ && relay_->peers_ready_;
        }
        if (!ready) {
            if (done)
                done(false, "No relay peers available");
            return;
        }
        bool ok = relay_->publish_(topic.c_str(), payload.data(), payload.size(), relay_->ctx_);
        if (done)
            done(ok, ok ? "" : "Publish rejected by relay");
    }

    void stop() override {
        {
            std::lock_guard lock{relay_->mutex_};
            if (stopped_)
                return;
            stopped_ = true;
        }
        relay_->cv_.notify_all();
        drop_subscription();
    }

  private:
    void drop_subscription() {
        std::lock_guard dlock{relay_->deliver_mutex_};
        std::lock_guard lock{relay_->mutex_};
        if (relay_->subscriber_ == this) {
            relay_->subscriber_ = nullptr;
            relay_->handler_ = nullptr;
        }
    }

    std::shared_ptr<HookRelay> relay_;
    std::string topic_;
    bool stopped_ = false;  // guarded by relay_->mutex_
};

std::unique_ptr<network::RelayNode> HookRelay::make_node() {
    return std::make_unique<HookRelayNode>(shared_from_this());
}

struct chat_session_internals {
    std::shared_ptr<HookRelay> relay;
    std::unique_ptr<ChatSession> session;
};

chat_session_internals& internals(chat_session_object* session) {
    assert(session && session->internals);
    return *static_cast<chat_session_internals*>(session->internals);
}

ChatSession& unbox(chat_session_object* session) {
    return *internals(session).session;
}
const ChatSession& unbox(const chat_session_object* session) {
    assert(session && session->internals);
    return *static_cast<const chat_session_internals*>(session->internals)->session;
}

bool set_error(chat_session_object* session, std::string_view e) {
    if (e.size() > 255)
        e.remove_suffix(e.size() - 255);
    std::memcpy(session->_error_buf, e.data(), e.size());
    session->_error_buf[e.size()] = 0;
    session->last_error = session->_error_buf;
    return false;
}

bool set_error_value(char* error, std::string_view e) {
    if (!error)
        return false;

    std::string msg = {e.data(), e.size()};
    if (msg.size() > 255)
        msg.resize(255);
    std::memcpy(error, msg.c_str(), msg.size() + 1);
    return false;
}

nlohmann::json transcript_json(
        const ChatSession& session, const std::vector<TranscriptEntry>& entries) {
    auto result = nlohmann::json::array();
    for (auto& e : entries) {
        auto& msg = e.message;
        nlohmann::json m{
                {"id", msg.id},
                {"sender", msg.sender},
                {"content", msg.content},
                {"timestamp", msg.timestamp},
                {"outgoing", e.outgoing},
                {"status", std::string{send_status_name(e.status)}}};
        if (msg.reply_to)
            m["reply_to"] = {
                    {"id", msg.reply_to->id},
                    {"sender", msg.reply_to->sender},
                    {"content", msg.reply_to->content}};
        auto reactions = nlohmann::json::object();
        for (auto& r : session.reactions(msg.id))
            reactions[r.emoji] = r.users;
        m["reactions"] = std::move(reactions);
        result.push_back(std::move(m));
    }
    return result;
}

}  // namespace

extern "C" {

LIBROOMCHAT_C_API bool chat_session_init(
        chat_session_object** session,
        const char* room_code,
        const char* display_name,
        bool (*publish)(const char* topic, const unsigned char* data, size_t datalen, void* ctx),
        void* publish_ctx,
        uint32_t connect_timeout_ms,
        bool legacy_reply_prefix,
        char* error) {
    try {
        if (!session || !room_code || !display_name)
            throw std::invalid_argument{"chat_session_init: missing required argument"};
        if (!publish)
            throw std::invalid_argument{"chat_session_init: a publish callback is required"};

        SessionOptions options;
        if (connect_timeout_ms > 0)
            options.connect_timeout = std::chrono::milliseconds{connect_timeout_ms};
        options.legacy_reply_prefix = legacy_reply_prefix;

        auto inner = std::make_unique<chat_session_internals>();
        inner->relay = std::make_shared<HookRelay>(publish, publish_ctx);
        inner->session = std::make_unique<ChatSession>(
                room_code,
                display_name,
                [relay = inner->relay] { return relay->make_node(); },
                options);

        auto s_object = std::make_unique<chat_session_object>();
        s_object->internals = inner.release();
        s_object->last_error = nullptr;
        *session = s_object.release();
        return true;
    } catch (const std::exception& e) {
        return set_error_value(error, e.what());
    }
}

LIBROOMCHAT_C_API void chat_session_free(chat_session_object* session) {
    if (!session)
        return;
    delete static_cast<chat_session_internals*>(session->internals);
    delete session;
}

LIBROOMCHAT_C_API const char* chat_session_topic(const chat_session_object* session) {
    return unbox(session).topic().c_str();
}

LIBROOMCHAT_C_API void chat_session_set_logger(
        chat_session_object* session,
        void (*callback)(chat_log_level lvl, const char* msg, void* ctx),
        void* ctx) {
    if (!callback)
        unbox(session).logger = nullptr;
    else {
        unbox(session).logger = [callback, ctx](LogLevel lvl, std::string msg) {
            callback(static_cast<chat_log_level>(static_cast<int>(lvl)), msg.c_str(), ctx);
        };
    }
}

LIBROOMCHAT_C_API void chat_session_set_messages_callback(
        chat_session_object* session, void (*callback)(const char* json, void* ctx), void* ctx) {
    auto& s = unbox(session);
    if (!callback)
        s.on_messages(nullptr);
    else {
        s.on_messages([&s, callback, ctx](std::vector<TranscriptEntry> entries) {
            auto json = transcript_json(s, entries).dump();
            callback(json.c_str(), ctx);
        });
    }
}

LIBROOMCHAT_C_API void chat_session_set_connection_state_callback(
        chat_session_object* session,
        void (*callback)(chat_connection_state state, const char* error, void* ctx),
        void* ctx) {
    if (!callback)
        unbox(session).on_connection_state(nullptr);
    else {
        unbox(session).on_connection_state(
                [callback, ctx](ConnectionState state, std::string error) {
                    callback(
                            static_cast<chat_connection_state>(static_cast<int>(state)),
                            error.c_str(),
                            ctx);
                });
    }
}

LIBROOMCHAT_C_API void chat_session_set_unread_callback(
        chat_session_object* session, void (*callback)(int unread, void* ctx), void* ctx) {
    if (!callback)
        unbox(session).on_unread(nullptr);
    else
        unbox(session).on_unread([callback, ctx](int unread) { callback(unread, ctx); });
}

LIBROOMCHAT_C_API void chat_session_set_notify_callback(
        chat_session_object* session,
        void (*callback)(const char* sender, const char* message_id, void* ctx),
        void* ctx) {
    if (!callback)
        unbox(session).on_notify(nullptr);
    else {
        unbox(session).on_notify([callback, ctx](std::string sender, std::string message_id) {
            callback(sender.c_str(), message_id.c_str(), ctx);
        });
    }
}

LIBROOMCHAT_C_API void chat_session_set_send_status_callback(
        chat_session_object* session,
        void (*callback)(const char* message_id, chat_send_status status, void* ctx),
        void* ctx) {
    if (!callback)
        unbox(session).on_send_status(nullptr);
    else {
        unbox(session).on_send_status([callback, ctx](std::string message_id, SendStatus status) {
            callback(
                    message_id.c_str(),
                    static_cast<chat_send_status>(static_cast<int>(status)),
                    ctx);
        });
    }
}

LIBROOMCHAT_C_API void chat_session_connect(chat_session_object* session) {
    unbox(session).connect();
}

LIBROOMCHAT_C_API void chat_session_set_peers_ready(chat_session_object* session, bool ready) {
    internals(session).relay->set_peers_ready(ready);
}

LIBROOMCHAT_C_API void chat_session_receive(
        chat_session_object* session, const unsigned char* data, size_t datalen) {
    if (!data)
        return;
    internals(session).relay->receive({data, datalen});
}

LIBROOMCHAT_C_API void chat_session_open(chat_session_object* session) {
    unbox(session).open();
}

LIBROOMCHAT_C_API void chat_session_close(chat_session_object* session) {
    unbox(session).close();
}

LIBROOMCHAT_C_API void chat_session_leave(chat_session_object* session) {
    unbox(session).leave();
}

LIBROOMCHAT_C_API bool chat_session_send(
        chat_session_object* session, const char* text, const char* reply_to, char* id_out) {
    try {
        if (!text)
            throw std::invalid_argument{"chat_session_send: text is required"};
        std::optional<std::string_view> reply;
        if (reply_to)
            reply = reply_to;
        auto id = unbox(session).send_message(text, reply);
        if (id_out) {
            assert(id.size() < CHAT_MESSAGE_ID_BUFFER);
            std::memcpy(id_out, id.c_str(), id.size() + 1);
        }
        return true;
    } catch (const std::exception& e) {
        return set_error(session, e.what());
    }
}

LIBROOMCHAT_C_API bool chat_session_resend(chat_session_object* session, const char* message_id) {
    if (!message_id)
        return false;
    return unbox(session).resend(message_id);
}

LIBROOMCHAT_C_API bool chat_session_toggle_reaction(
        chat_session_object* session, const char* message_id, const char* emoji, bool* added) {
    try {
        if (!message_id || !emoji)
            throw std::invalid_argument{"chat_session_toggle_reaction: missing required argument"};
        bool result = unbox(session).toggle_reaction(message_id, emoji);
        if (added)
            *added = result;
        return true;
    } catch (const std::exception& e) {
        return set_error(session, e.what());
    }
}

LIBROOMCHAT_C_API int chat_session_unread(const chat_session_object* session) {
    return unbox(session).unread();
}

LIBROOMCHAT_C_API bool chat_session_is_open(const chat_session_object* session) {
    return unbox(session).is_open();
}

LIBROOMCHAT_C_API chat_connection_state
chat_session_connection_state(const chat_session_object* session) {
    return static_cast<chat_connection_state>(
            static_cast<int>(unbox(session).connection_state()));
}

LIBROOMCHAT_C_API char* chat_session_messages_json(chat_session_object* session) {
    try {
        auto& s = unbox(session);
        auto json = transcript_json(s, s.messages()).dump();
        auto* out = static_cast<char*>(std::malloc(json.size() + 1));
        if (!out)
            throw std::bad_alloc{};
        std::memcpy(out, json.c_str(), json.size() + 1);
        return out;
    } catch (const std::exception& e) {
        set_error(session, e.what());
        return nullptr;
    }
}

}  // extern "C"

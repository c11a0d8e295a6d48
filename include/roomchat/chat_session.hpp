#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chat_session.h"
#include "logging.hpp"
#include "message.hpp"
#include "network_client.hpp"
#include "reactions.hpp"
#include "relay.hpp"
#include "room.hpp"
#include "transcript.hpp"

namespace roomchat {

/// Per-session settings, fixed at construction.
struct SessionOptions {
    /// How long a connect attempt waits for relay peers before entering the error state.
    std::chrono::milliseconds connect_timeout = network::DEFAULT_CONNECT_TIMEOUT;

    /// UTF-16 code units of the replied-to content kept in a reply preview.
    size_t reply_preview_chars = message::REPLY_PREVIEW_CHARS;

    /// When true, replies also carry the textual `↩️ sender: "preview"` prefix in their content
    /// (so that peers which only understand the prefix still see the reply), and incoming content
    /// carrying such a prefix is turned back into a structured reply.
    bool legacy_reply_prefix = false;
};

/// One chat room, as joined by one participant.
///
/// A ChatSession derives the room key and topic from the room code, owns the network client that
/// talks to the relay, and keeps the transcript, reactions and unread count for as long as the
/// object lives.  Leaving the room (or destroying the session) closes the connection; the
/// transcript survives `leave()` but is never persisted.
///
/// The session starts closed: messages from other participants count as unread (and fire the
/// notify hook) until `open()` is called, and again after `close()`.
///
/// Hooks must be set before `connect()`.  They may be called from relay threads, never with the
/// session lock held, so they may call back into the session.  Hooks are delivered one at a time,
/// in the order the state changes were made: events raised while a hook is running (by a call
/// from inside the hook, or from another thread) are delivered after it returns, so a call may
/// return before its own hooks have run.  The notify hook is skipped if the session has been
/// opened by the time it would be delivered.
class ChatSession {
  public:
    /// API: chat_session/ChatSession::ChatSession
    ///
    /// Constructs a session for a room.  Does not connect.
    ///
    /// Inputs:
    /// - `room_code` -- the shared room code; canonicalized (uppercased, see
    ///   `room::canonical_code`) before use.
    /// - `display_name` -- the name this participant's messages are sent under.  Self-asserted:
    ///   nothing stops two participants from using the same name.
    /// - `factory` -- creates the relay node for each connect attempt.
    /// - `options` -- session settings.
    ///
    /// Throws std::invalid_argument for an invalid room code or an empty or invalid display name.
    ChatSession(
            std::string_view room_code,
            std::string_view display_name,
            network::relay_factory factory,
            SessionOptions options = {});

    ~ChatSession();

    // Object is non-movable and non-copyable; you need to hold it in a smart pointer if it needs to
    // be managed.
    ChatSession(ChatSession&&) = delete;
    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(ChatSession&&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    // If set then we log things by calling this callback.  Also receives the network client's log
    // output.
    logger_t logger;

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// Hook called with a snapshot of the transcript whenever it changes (a message is added or a
    /// send status changes).
    void on_messages(std::function<void(std::vector<TranscriptEntry> entries)> hook) {
        messages_hook_ = std::move(hook);
    }

    /// Hook called on every connection state change; `error` describes the failure when `state`
    /// is ConnectionState::error.
    void on_connection_state(std::function<void(ConnectionState state, std::string error)> hook) {
        state_hook_ = std::move(hook);
    }

    /// Hook called with the new unread count whenever it changes.
    void on_unread(std::function<void(int unread)> hook) { unread_hook_ = std::move(hook); }

    /// Hook called when a message from someone else arrives while the session is closed; meant
    /// for a notification sound or banner.
    void on_notify(std::function<void(std::string sender, std::string message_id)> hook) {
        notify_hook_ = std::move(hook);
    }

    /// Hook called when the relay reports the outcome of publishing one of our messages.
    void on_send_status(std::function<void(std::string message_id, SendStatus status)> hook) {
        send_status_hook_ = std::move(hook);
    }

    /// API: chat_session/ChatSession::connect
    ///
    /// Starts connecting to the room in the background.  Does nothing if already connecting or
    /// connected; after an error or `leave()` this is the manual retry.
    void connect();

    /// API: chat_session/ChatSession::retry
    ///
    /// Reconnects if the session is in the error or disconnected state.  Returns true if a new
    /// connect attempt was started.
    bool retry();

    /// API: chat_session/ChatSession::open
    ///
    /// Marks the session visible.  Resets the unread count to 0 (firing the unread hook) if the
    /// session was closed.
    void open();

    /// API: chat_session/ChatSession::close
    ///
    /// Marks the session hidden; subsequent messages from others count as unread.
    void close();

    /// API: chat_session/ChatSession::leave
    ///
    /// Disconnects from the room.  Messages still waiting on a publish result are marked failed.
    /// The transcript is kept.
    void leave();

    /// API: chat_session/ChatSession::send_message
    ///
    /// Sends a text message to the room.  The message is added to the transcript immediately as
    /// `pending`; the send status hook later reports `sent` or `failed`.  A message sent while not
    /// connected fails straight away.
    ///
    /// Inputs:
    /// - `text` -- message text; leading and trailing whitespace is removed.
    /// - `reply_to` -- optional id of a transcript message this is a reply to.
    ///
    /// Outputs:
    /// - `std::string` -- the new message's id.
    ///
    /// Throws std::invalid_argument if the text is empty (after trimming), too long or not UTF-8,
    /// or if `reply_to` is not in the transcript.
    std::string send_message(
            std::string_view text, std::optional<std::string_view> reply_to = std::nullopt);

    /// API: chat_session/ChatSession::resend
    ///
    /// Publishes one of our messages again, with the same id, after its send failed.  Returns
    /// false if `message_id` is not a failed message of ours.
    bool resend(std::string_view message_id);

    /// API: chat_session/ChatSession::toggle_reaction
    ///
    /// Toggles this participant's `emoji` reaction on a transcript message.  Reactions are local
    /// and are not sent to the room.  Returns true if the reaction is now present.
    ///
    /// Throws std::invalid_argument for an emoji outside REACTION_EMOJI or an unknown message.
    bool toggle_reaction(const std::string& message_id, std::string_view emoji);

    /// The transcript, sorted by timestamp.
    std::vector<TranscriptEntry> messages() const;

    /// The transcript entry with the given id, if any.
    std::optional<TranscriptEntry> message(std::string_view id) const;

    std::vector<Reaction> reactions(const std::string& message_id) const;

    ConnectionState connection_state() const;
    std::string last_error() const;
    int unread() const;
    bool is_open() const;

    const std::string& room_code() const { return room_code_; }
    const std::string& topic() const { return topic_; }
    const std::string& display_name() const { return display_name_; }
    const SessionOptions& options() const { return options_; }

  private:
    // Hook invocations gathered under the lock and fired after it is released, in the order the
    // state changes were made.
    struct pending_events {
        std::optional<std::vector<TranscriptEntry>> messages;
        std::optional<int> unread;
        std::optional<std::pair<std::string, std::string>> notify;
        std::vector<std::pair<std::string, SendStatus>> send_status;
    };

    // Requires mutex_ to be held.
    void queue_events(pending_events ev);
    // Delivers queued events; call without holding mutex_.
    void dispatch();
    void fire(pending_events ev);

    template <typename Hook, typename... Args>
    void invoke(std::string_view name, const Hook& hook, Args&&... args) {
        if (!hook)
            return;
        try {
            hook(std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            log(LogLevel::error, std::string{name} + " hook threw: " + e.what());
        }
    }

    void handle_message(ChatMessage msg);
    void handle_state(ConnectionState state, std::string error);
    void handle_publish_result(const std::string& id, bool success, std::string error);
    void publish(const ChatMessage& msg);

    const std::string room_code_;
    const std::string topic_;
    const std::string display_name_;
    const SessionOptions options_;

    std::function<void(std::vector<TranscriptEntry>)> messages_hook_;
    std::function<void(ConnectionState, std::string)> state_hook_;
    std::function<void(int)> unread_hook_;
    std::function<void(std::string, std::string)> notify_hook_;
    std::function<void(std::string, SendStatus)> send_status_hook_;

    mutable std::mutex mutex_;
    Transcript transcript_;
    Reactions reactions_;
    int unread_ = 0;
    bool open_ = false;
    std::deque<pending_events> events_;
    bool dispatching_ = false;

    std::unique_ptr<network::NetworkClient> client_;
};

}  // namespace roomchat

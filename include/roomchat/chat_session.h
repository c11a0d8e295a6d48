#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "export.h"

typedef struct chat_session_object {
    // Internal opaque object pointer; calling code should leave this alone.
    void* internals;

    // When an error occurs in the C API this string will be set to the specific error message.  May
    // be empty.
    const char* last_error;

    // Sometimes used as the backing buffer for `last_error`.  Should not be touched externally.
    char _error_buf[256];
} chat_session_object;

typedef enum chat_log_level {
    CHAT_LOG_LEVEL_DEBUG = 0,
    CHAT_LOG_LEVEL_INFO,
    CHAT_LOG_LEVEL_WARNING,
    CHAT_LOG_LEVEL_ERROR
} chat_log_level;

typedef enum chat_connection_state {
    CHAT_CONNECTION_DISCONNECTED = 0,
    CHAT_CONNECTION_CONNECTING = 1,
    CHAT_CONNECTION_CONNECTED = 2,
    CHAT_CONNECTION_ERROR = 3,
} chat_connection_state;

typedef enum chat_send_status {
    CHAT_SEND_PENDING = 0,
    CHAT_SEND_SENT = 1,
    CHAT_SEND_FAILED = 2,
    CHAT_SEND_RECEIVED = 3,
} chat_send_status;

/// Size of a buffer large enough for any message id, including the null terminator.
#define CHAT_MESSAGE_ID_BUFFER 129

/// API: chat_session/chat_session_init
///
/// Constructs a chat session for a room.  The session talks to the relay network through the
/// embedder: outgoing payloads are handed to `publish`, the embedder reports peer availability
/// with `chat_session_set_peers_ready` and passes payloads received on the session's topic to
/// `chat_session_receive`.
///
/// When done with the object the `chat_session_object` must be destroyed by passing the pointer to
/// chat_session_free().
///
/// Inputs:
/// - `session` -- [out] Pointer to the session object
/// - `room_code` -- [in] null-terminated room code (case-insensitive)
/// - `display_name` -- [in] null-terminated display name to send messages under
/// - `publish` -- [in] called to send a payload on `topic`; returns true if a relay peer accepted
///   it.  May be called from any thread.  Must not be NULL.
/// - `publish_ctx` -- [in] passed through to `publish`
/// - `connect_timeout_ms` -- [in] how long to wait for peers on connect; 0 for the default (20s)
/// - `legacy_reply_prefix` -- [in] also carry replies as a textual content prefix
/// - `error` -- [out] the pointer to a buffer in which we will write an error string if an error
/// occurs; error messages are discarded if this is given as NULL.  If non-NULL this must be a
/// buffer of at least 256 bytes.
///
/// Outputs:
/// - `bool` -- Returns true on success; returns false and writes the exception message as a
/// C-string into `error` (if not NULL) on failure.
LIBROOMCHAT_EXPORT bool chat_session_init(
        chat_session_object** session,
        const char* room_code,
        const char* display_name,
        bool (*publish)(const char* topic, const unsigned char* data, size_t datalen, void* ctx),
        void* publish_ctx,
        uint32_t connect_timeout_ms,
        bool legacy_reply_prefix,
        char* error) __attribute__((warn_unused_result));

/// API: chat_session/chat_session_free
///
/// Leaves the room and frees the session object.
///
/// Inputs:
/// - `session` -- [in] Pointer to chat_session_object object
LIBROOMCHAT_EXPORT void chat_session_free(chat_session_object* session);

/// API: chat_session/chat_session_topic
///
/// Returns the null-terminated content topic the session publishes and listens on.  The pointer is
/// valid for the lifetime of the session.
LIBROOMCHAT_EXPORT const char* chat_session_topic(const chat_session_object* session);

/// API: chat_session/chat_session_set_logger
///
/// Sets a logging function; pass NULL to remove it.
///
/// Inputs:
/// - `session` -- [in] Pointer to chat_session_object object
/// - `callback` -- [in] callback invoked with the level, a null-terminated message and `ctx`
/// - `ctx` -- [in] passed through to `callback`
LIBROOMCHAT_EXPORT void chat_session_set_logger(
        chat_session_object* session,
        void (*callback)(chat_log_level lvl, const char* msg, void* ctx),
        void* ctx);

/// API: chat_session/chat_session_set_messages_callback
///
/// Sets the callback invoked with a JSON snapshot of the transcript (as returned by
/// `chat_session_messages_json`) whenever it changes.
LIBROOMCHAT_EXPORT void chat_session_set_messages_callback(
        chat_session_object* session,
        void (*callback)(const char* json, void* ctx),
        void* ctx);

/// API: chat_session/chat_session_set_connection_state_callback
///
/// Sets the callback invoked on connection state changes.  `error` is an empty string unless
/// `state` is CHAT_CONNECTION_ERROR.
LIBROOMCHAT_EXPORT void chat_session_set_connection_state_callback(
        chat_session_object* session,
        void (*callback)(chat_connection_state state, const char* error, void* ctx),
        void* ctx);

/// API: chat_session/chat_session_set_unread_callback
///
/// Sets the callback invoked with the new unread count whenever it changes.
LIBROOMCHAT_EXPORT void chat_session_set_unread_callback(
        chat_session_object* session, void (*callback)(int unread, void* ctx), void* ctx);

/// API: chat_session/chat_session_set_notify_callback
///
/// Sets the callback invoked when a message from someone else arrives while the session is closed.
LIBROOMCHAT_EXPORT void chat_session_set_notify_callback(
        chat_session_object* session,
        void (*callback)(const char* sender, const char* message_id, void* ctx),
        void* ctx);

/// API: chat_session/chat_session_set_send_status_callback
///
/// Sets the callback invoked when the send status of one of our messages changes.
LIBROOMCHAT_EXPORT void chat_session_set_send_status_callback(
        chat_session_object* session,
        void (*callback)(const char* message_id, chat_send_status status, void* ctx),
        void* ctx);

/// API: chat_session/chat_session_connect
///
/// Starts connecting in the background; the outcome is reported through the connection state
/// callback.  Also used to retry after an error.
LIBROOMCHAT_EXPORT void chat_session_connect(chat_session_object* session);

/// API: chat_session/chat_session_set_peers_ready
///
/// Tells the session whether the embedder's relay currently has peers able to deliver and serve
/// the topic.  A pending connect completes once this is set to true.
LIBROOMCHAT_EXPORT void chat_session_set_peers_ready(chat_session_object* session, bool ready);

/// API: chat_session/chat_session_receive
///
/// Passes a payload received on the session's topic into the session.  Payloads that do not
/// decrypt and decode are dropped.
///
/// Inputs:
/// - `session` -- [in] Pointer to chat_session_object object
/// - `data` -- [in] payload bytes
/// - `datalen` -- [in] length of `data`
LIBROOMCHAT_EXPORT void chat_session_receive(
        chat_session_object* session, const unsigned char* data, size_t datalen);

/// API: chat_session/chat_session_open
///
/// Marks the session visible and resets the unread count.
LIBROOMCHAT_EXPORT void chat_session_open(chat_session_object* session);

/// API: chat_session/chat_session_close
///
/// Marks the session hidden.
LIBROOMCHAT_EXPORT void chat_session_close(chat_session_object* session);

/// API: chat_session/chat_session_leave
///
/// Disconnects from the room, keeping the transcript.
LIBROOMCHAT_EXPORT void chat_session_leave(chat_session_object* session);

/// API: chat_session/chat_session_send
///
/// Sends a text message.
///
/// Inputs:
/// - `session` -- [in] Pointer to chat_session_object object
/// - `text` -- [in] null-terminated message text
/// - `reply_to` -- [in] id of the message being replied to, or NULL
/// - `id_out` -- [out] buffer of at least CHAT_MESSAGE_ID_BUFFER bytes for the new message id; may
///   be NULL
///
/// Outputs:
/// - `bool` -- true if the message was added to the transcript and handed to the relay; false (with
///   `session->last_error` set) if the text or reply target was invalid.
LIBROOMCHAT_EXPORT bool chat_session_send(
        chat_session_object* session, const char* text, const char* reply_to, char* id_out);

/// API: chat_session/chat_session_resend
///
/// Sends a failed message again.  Returns false if `message_id` is not a failed message of ours.
LIBROOMCHAT_EXPORT bool chat_session_resend(chat_session_object* session, const char* message_id);

/// API: chat_session/chat_session_toggle_reaction
///
/// Toggles our reaction on a message.
///
/// Inputs:
/// - `session` -- [in] Pointer to chat_session_object object
/// - `message_id` -- [in] the message to react to
/// - `emoji` -- [in] null-terminated UTF-8 emoji, one of the reaction palette
/// - `added` -- [out] set to true if the reaction is now present, false if it was removed; may be
///   NULL
///
/// Outputs:
/// - `bool` -- false (with `session->last_error` set) for an unknown message or emoji.
LIBROOMCHAT_EXPORT bool chat_session_toggle_reaction(
        chat_session_object* session, const char* message_id, const char* emoji, bool* added);

/// API: chat_session/chat_session_unread
///
/// Returns the number of messages from others received while the session was closed.
LIBROOMCHAT_EXPORT int chat_session_unread(const chat_session_object* session);

/// API: chat_session/chat_session_is_open
LIBROOMCHAT_EXPORT bool chat_session_is_open(const chat_session_object* session);

/// API: chat_session/chat_session_connection_state
LIBROOMCHAT_EXPORT chat_connection_state
chat_session_connection_state(const chat_session_object* session);

/// API: chat_session/chat_session_messages_json
///
/// Returns the transcript as a JSON array, oldest first.  Each element has keys `id`, `sender`,
/// `content`, `timestamp`, `outgoing`, `status` ("pending", "sent", "failed" or "received"),
/// `reactions` (an object of emoji to display names) and, for replies, `reply_to` (an object with
/// `id`, `sender` and `content`).
///
/// NB: It is the caller's responsibility to `free()` the returned string.
///
/// Outputs:
/// - `char*` -- null-terminated JSON, or NULL on error.
LIBROOMCHAT_EXPORT char* chat_session_messages_json(chat_session_object* session);

#ifdef __cplusplus
}  // extern "C"
#endif

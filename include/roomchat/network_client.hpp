#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "envelope.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "relay.hpp"
#include "types.hpp"
#include "util.hpp"

namespace roomchat {

enum class ConnectionState : int {
    disconnected = 0,
    connecting = 1,
    connected = 2,
    error = 3,
};

std::string_view connection_state_name(ConnectionState s);

namespace network {

    using namespace std::literals;

    /// How long connect() waits for usable peers before giving up and entering the error state.
    inline constexpr auto DEFAULT_CONNECT_TIMEOUT = 20s;

    /// Publishes and receives the chat messages of one room over a relay node.
    ///
    /// The client encrypts with the room key on the way out and decrypts on the way in; anything on
    /// the topic that does not decrypt and decode is dropped and logged.  It does not deduplicate
    /// or reorder: the relay is at-least-once and unordered, and that is passed straight through.
    ///
    /// Hooks (`logger`, `on_state_change`, `on_message`) must be set before calling `connect()`;
    /// they are invoked from the connect worker thread and from relay threads, never while the
    /// client's internal lock is held, and never after `teardown()` has returned.
    class NetworkClient {
      public:
        NetworkClient(
                std::string topic,
                const room::Key& key,
                relay_factory factory,
                std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT);

        ~NetworkClient();

        // Object is non-movable and non-copyable; the worker thread and relay callbacks hold
        // pointers to it.
        NetworkClient(NetworkClient&&) = delete;
        NetworkClient(const NetworkClient&) = delete;
        NetworkClient& operator=(NetworkClient&&) = delete;
        NetworkClient& operator=(const NetworkClient&) = delete;

        // If set then we log things by calling this callback
        logger_t logger;

        /// Hook called on every connection state transition with the new state and, for the error
        /// state, a description of the failure.
        void on_state_change(std::function<void(ConnectionState state, std::string error)> hook) {
            state_hook_ = std::move(hook);
        }

        /// Hook called for every message received on the topic that decrypts and decodes.
        void on_message(std::function<void(ChatMessage msg)> hook) {
            message_hook_ = std::move(hook);
        }

        /// API: network/NetworkClient::connect
        ///
        /// Starts connecting and returns immediately.  A worker thread creates a relay node,
        /// starts it, waits (up to the connect timeout) for a peer serving both light push and
        /// filter, then subscribes to the room topic.  The outcome is reported through the state
        /// hook: `connected`, or `error` on timeout or bootstrap failure.
        ///
        /// Does nothing while connecting or connected.  From `error` or `disconnected` this is the
        /// manual retry: the client never retries on its own.
        void connect();

        /// API: network/NetworkClient::publish
        ///
        /// Encrypts `msg` and sends it as a single best-effort datagram.  `done` reports whether a
        /// peer accepted it; it is called with `false` straight away if the client is not
        /// connected or the message cannot be encoded.  Nothing is retried or acknowledged end to
        /// end; if teardown happens first, `done` is never called.
        void publish(const ChatMessage& msg, publish_callback done);

        /// API: network/NetworkClient::teardown
        ///
        /// Cancels any pending connect, unsubscribes, stops the relay node and waits for the
        /// worker thread.  Safe to call at any time, repeatedly, and from within a hook.
        /// In-flight publishes are abandoned.
        void teardown();

        ConnectionState state() const;

        /// Description of the last connection failure; empty if there was none.
        std::string last_error() const;

        const std::string& topic() const { return topic_; }

      private:
        // Serializes hook invocations against teardown; closed by teardown so that no hook runs
        // after teardown returns.
        struct callback_guard {
            std::recursive_mutex mutex;
            bool open = true;
        };

        template <typename F>
        static bool run_guarded(const std::shared_ptr<callback_guard>& guard, F&& f) {
            std::lock_guard lock{guard->mutex};
            if (!guard->open)
                return false;
            f();
            return true;
        }

        void run_connect(
                std::shared_ptr<RelayNode> node,
                std::shared_ptr<callback_guard> guard,
                uint64_t attempt);

        bool transition(
                const std::shared_ptr<callback_guard>& guard,
                uint64_t attempt,
                ConnectionState state,
                std::string error = "");

        void handle_payload(
                const std::shared_ptr<callback_guard>& guard,
                const envelope::Decoder& decoder,
                ustring payload);

        void notify_state(ConnectionState state, std::string error);

        // Invokes the `logger` callback if set, does nothing if there is no logger.
        void log(LogLevel lvl, std::string msg) {
            if (logger)
                logger(lvl, std::move(msg));
        }

        const std::string topic_;
        const sodium_cleared<room::Key> key_;
        const relay_factory factory_;
        const std::chrono::milliseconds connect_timeout_;

        std::function<void(ConnectionState, std::string)> state_hook_;
        std::function<void(ChatMessage)> message_hook_;

        mutable std::mutex mutex_;
        ConnectionState state_ = ConnectionState::disconnected;
        std::string last_error_;
        uint64_t attempt_ = 0;
        std::shared_ptr<RelayNode> node_;
        std::shared_ptr<const envelope::Encoder> encoder_;
        std::shared_ptr<callback_guard> guard_;
        std::thread worker_;
    };

}  // namespace network

}  // namespace roomchat

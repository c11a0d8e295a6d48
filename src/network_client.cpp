#include "roomchat/network_client.hpp"

#include <sodium/core.h>

#include <stdexcept>
#include <variant>

using namespace std::literals;

namespace roomchat {

std::string_view connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::disconnected: return "disconnected"sv;
        case ConnectionState::connecting: return "connecting"sv;
        case ConnectionState::connected: return "connected"sv;
        case ConnectionState::error: return "error"sv;
    }
    return "unknown"sv;
}

namespace network {

    std::string protocol_name(Protocol p) {
        switch (p) {
            case Protocol::light_push: return "light_push";
            case Protocol::filter: return "filter";
        }
        return "unknown";
    }

    namespace {

        // Joins a finished or finishing worker thread.  A worker that tears its own client down
        // from inside a hook cannot join itself, so it is detached instead.
        void reap(std::thread& worker) {
            if (!worker.joinable())
                return;
            if (worker.get_id() == std::this_thread::get_id())
                worker.detach();
            else
                worker.join();
        }

    }  // namespace

    NetworkClient::NetworkClient(
            std::string topic,
            const room::Key& key,
            relay_factory factory,
            std::chrono::milliseconds connect_timeout) :
            topic_{std::move(topic)},
            key_{key},
            factory_{std::move(factory)},
            connect_timeout_{connect_timeout} {
        if (sodium_init() == -1)
            throw std::runtime_error{"libsodium initialization failed!"};
        if (topic_.empty())
            throw std::invalid_argument{"NetworkClient requires a non-empty topic"};
        if (!factory_)
            throw std::invalid_argument{"NetworkClient requires a relay factory"};
        if (connect_timeout_.count() <= 0)
            throw std::invalid_argument{"NetworkClient requires a positive connect timeout"};
    }

    NetworkClient::~NetworkClient() {
        teardown();
    }

    ConnectionState NetworkClient::state() const {
        std::lock_guard lock{mutex_};
        return state_;
    }

    std::string NetworkClient::last_error() const {
        std::lock_guard lock{mutex_};
        return last_error_;
    }

    void NetworkClient::notify_state(ConnectionState state, std::string error) {
        if (!state_hook_)
            return;
        try {
            state_hook_(state, std::move(error));
        } catch (const std::exception& e) {
            log(LogLevel::error, "Connection state hook threw: "s + e.what());
        }
    }

    void NetworkClient::connect() {
        std::thread previous;
        std::shared_ptr<callback_guard> old_guard, guard;
        uint64_t attempt;
        {
            std::lock_guard lock{mutex_};
            if (state_ == ConnectionState::connecting || state_ == ConnectionState::connected)
                return;
            previous = std::move(worker_);
            old_guard = std::move(guard_);
            node_.reset();
            encoder_.reset();
            attempt = ++attempt_;
            state_ = ConnectionState::connecting;
            last_error_.clear();
            guard = guard_ = std::make_shared<callback_guard>();
        }

        if (old_guard) {
            std::lock_guard lock{old_guard->mutex};
            old_guard->open = false;
        }
        reap(previous);

        log(LogLevel::info, "Connecting to " + topic_);
        run_guarded(guard, [&] { notify_state(ConnectionState::connecting, ""); });

        std::shared_ptr<RelayNode> node;
        try {
            node = factory_();
            if (!node)
                throw std::runtime_error{"relay factory returned no node"};
        } catch (const std::exception& e) {
            transition(
                    guard,
                    attempt,
                    ConnectionState::error,
                    "Failed to create relay node: "s + e.what());
            return;
        }

        std::lock_guard lock{mutex_};
        if (attempt != attempt_)
            return;  // torn down while we were creating the node
        node_ = node;
        worker_ = std::thread{&NetworkClient::run_connect, this, std::move(node), guard, attempt};
    }

    bool NetworkClient::transition(
            const std::shared_ptr<callback_guard>& guard,
            uint64_t attempt,
            ConnectionState state,
            std::string error) {
        bool applied = false;
        run_guarded(guard, [&] {
            {
                std::lock_guard lock{mutex_};
                if (attempt != attempt_)
                    return;
                state_ = state;
                if (state == ConnectionState::error) {
                    last_error_ = error;
                    encoder_.reset();
                }
            }
            applied = true;

            if (state == ConnectionState::error)
                log(LogLevel::error, "Connection to " + topic_ + " failed: " + error);
            else
                log(LogLevel::info,
                    "Connection to " + topic_ + " is " + std::string{connection_state_name(state)});

            notify_state(state, std::move(error));
        });
        return applied;
    }

    void NetworkClient::run_connect(
            std::shared_ptr<RelayNode> node,
            std::shared_ptr<callback_guard> guard,
            uint64_t attempt) {
        try {
            log(LogLevel::debug, "Starting relay node");
            node->start();

            log(LogLevel::debug, "Waiting for light push and filter peers");
            if (!node->wait_for_peers({Protocol::light_push, Protocol::filter}, connect_timeout_)) {
                node->stop();
                transition(
                        guard,
                        attempt,
                        ConnectionState::error,
                        "Timed out after " + std::to_string(connect_timeout_.count()) +
                                "ms waiting for relay peers");
                return;
            }

            auto encoder = std::make_shared<const envelope::Encoder>(topic_, key_);
            auto decoder = std::make_shared<const envelope::Decoder>(topic_, key_);

            node->subscribe(topic_, [this, guard, decoder](ustring payload) {
                handle_payload(guard, *decoder, std::move(payload));
            });

            {
                std::lock_guard lock{mutex_};
                if (attempt != attempt_)
                    return;
                encoder_ = std::move(encoder);
            }

            transition(guard, attempt, ConnectionState::connected);
        } catch (const std::exception& e) {
            node->stop();
            transition(guard, attempt, ConnectionState::error, "Failed to connect: "s + e.what());
        }
    }

    void NetworkClient::handle_payload(
            const std::shared_ptr<callback_guard>& guard,
            const envelope::Decoder& decoder,
            ustring payload) {
        run_guarded(guard, [&] {
            auto result = decoder.decode(payload);
            if (auto* err = std::get_if<message::decode_error>(&result)) {
                log(LogLevel::warning,
                    "Dropping undecodable " + std::to_string(payload.size()) + "-byte payload: " +
                            err->what());
                return;
            }

            auto& msg = std::get<ChatMessage>(result);
            log(LogLevel::debug, "Received message " + msg.id);
            if (!message_hook_)
                return;
            try {
                message_hook_(std::move(msg));
            } catch (const std::exception& e) {
                log(LogLevel::error, "Message hook threw: "s + e.what());
            }
        });
    }

    void NetworkClient::publish(const ChatMessage& msg, publish_callback done) {
        auto cb = std::make_shared<publish_callback>(std::move(done));
        auto fail = [&cb](std::string error) {
            if (*cb)
                (*cb)(false, std::move(error));
        };

        std::shared_ptr<RelayNode> node;
        std::shared_ptr<const envelope::Encoder> encoder;
        std::shared_ptr<callback_guard> guard;
        {
            std::lock_guard lock{mutex_};
            if (state_ == ConnectionState::connected) {
                node = node_;
                encoder = encoder_;
                guard = guard_;
            }
        }
        if (!node || !encoder)
            return fail("Not connected");

        ustring payload;
        try {
            payload = encoder->encode(msg);
        } catch (const std::invalid_argument& e) {
            log(LogLevel::warning, "Unable to encode message " + msg.id + ": " + e.what());
            return fail(e.what());
        }

        log(LogLevel::debug,
            "Publishing message " + msg.id + " (" + std::to_string(payload.size()) + " bytes)");
        try {
            node->publish(
                    topic_, std::move(payload), [this, guard, cb](bool success, std::string error) {
                        run_guarded(guard, [&] {
                            if (!success)
                                log(LogLevel::warning, "Publish failed: " + error);
                            if (!*cb)
                                return;
                            try {
                                (*cb)(success, std::move(error));
                            } catch (const std::exception& e) {
                                log(LogLevel::error, "Publish callback threw: "s + e.what());
                            }
                        });
                    });
        } catch (const std::exception& e) {
            log(LogLevel::warning, "Publish failed: "s + e.what());
            fail(e.what());
        }
    }

    void NetworkClient::teardown() {
        std::shared_ptr<RelayNode> node;
        std::shared_ptr<callback_guard> guard;
        std::thread worker;
        ConnectionState prev;
        {
            std::lock_guard lock{mutex_};
            attempt_++;
            node = std::move(node_);
            guard = std::move(guard_);
            worker = std::move(worker_);
            encoder_.reset();
            prev = state_;
            state_ = ConnectionState::disconnected;
        }

        if (guard) {
            // Waits out any hook currently running on another thread
            std::lock_guard lock{guard->mutex};
            guard->open = false;
        }

        if (node) {
            node->unsubscribe(topic_);
            node->stop();
        }
        reap(worker);

        if (prev != ConnectionState::disconnected) {
            log(LogLevel::info, "Disconnected from " + topic_);
            notify_state(ConnectionState::disconnected, "");
        }
    }

}  // namespace network

}  // namespace roomchat

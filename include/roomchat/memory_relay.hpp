#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "relay.hpp"

namespace roomchat::network {

class MemoryRelayNode;

/// An in-process relay network: every node created from the same MemoryRelay sees every payload
/// published on the topics it subscribes to.  Delivery happens synchronously on the publishing
/// thread unless held.
///
/// The relay can be made to misbehave the way a real one does: withholding peers, delivering
/// payloads more than once, delivering them out of order, failing publishes, and carrying payloads
/// from foreign publishers.
class MemoryRelay : public std::enable_shared_from_this<MemoryRelay> {
  public:
    static std::shared_ptr<MemoryRelay> create() {
        return std::shared_ptr<MemoryRelay>{new MemoryRelay{}};
    }

    MemoryRelay(const MemoryRelay&) = delete;
    MemoryRelay& operator=(const MemoryRelay&) = delete;

    /// Returns a factory producing nodes attached to this relay.
    relay_factory factory();

    /// Creates a new, unstarted node attached to this relay.
    std::unique_ptr<RelayNode> make_node();

    /// Controls whether nodes can find peers.  While false, `wait_for_peers` blocks (until its
    /// timeout) and publishes fail.  Setting it to true wakes any waiting nodes.  Default: true.
    void set_peers_available(bool available);

    /// When set, `start()` on new nodes throws.  Default: false.
    void set_fail_start(bool fail);

    /// Each published payload is delivered `1 + extra` times.  Default: 0.
    void set_duplicates(int extra);

    /// When set, published payloads are queued instead of delivered until `flush()`.
    void set_hold(bool hold);

    /// Delivers all held payloads, newest first unless `in_order` is true.  Returns the number of
    /// payloads flushed.
    size_t flush(bool in_order = false);

    /// When set, publishes are rejected (reported as failed) and nothing is delivered.
    void set_fail_publishes(bool fail);

    /// Delivers `payload` on `topic` as though published by a peer outside this process.
    void inject(const std::string& topic, ustring payload);

    /// Every payload successfully published so far, with its topic.
    std::vector<std::pair<std::string, ustring>> published() const;

    /// Number of nodes currently started and not stopped.
    int running_nodes() const;

    /// Number of active subscriptions on `topic`.
    int subscribers(const std::string& topic) const;

  private:
    friend class MemoryRelayNode;

    MemoryRelay() = default;

    struct subscription {
        MemoryRelayNode* node;
        std::recursive_mutex mutex;
        bool active = true;
        payload_handler handler;
    };

    void deliver(const std::string& topic, const ustring& payload);

    mutable std::mutex mutex_;
    std::condition_variable peers_cv_;
    bool peers_available_ = true;
    bool fail_start_ = false;
    bool fail_publishes_ = false;
    bool hold_ = false;
    int duplicates_ = 0;
    int running_ = 0;
    std::deque<std::pair<std::string, ustring>> held_;
    std::vector<std::pair<std::string, ustring>> published_;
    std::multimap<std::string, std::shared_ptr<subscription>> subscriptions_;
};

class MemoryRelayNode : public RelayNode {
  public:
    explicit MemoryRelayNode(std::shared_ptr<MemoryRelay> relay);
    ~MemoryRelayNode() override;

    void start() override;
    bool wait_for_peers(
            const std::vector<Protocol>& protocols, std::chrono::milliseconds timeout) override;
    void subscribe(const std::string& topic, payload_handler handler) override;
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, ustring payload, publish_callback done) override;
    void stop() override;

  private:
    std::shared_ptr<MemoryRelay> relay_;
    // Guarded by relay_->mutex_
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace roomchat::network

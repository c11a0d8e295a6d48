#include "roomchat/memory_relay.hpp"

#include <stdexcept>

namespace roomchat::network {

relay_factory MemoryRelay::factory() {
    return [self = shared_from_this()] { return self->make_node(); };
}

std::unique_ptr<RelayNode> MemoryRelay::make_node() {
    return std::make_unique<MemoryRelayNode>(shared_from_this());
}

void MemoryRelay::set_peers_available(bool available) {
    {
        std::lock_guard lock{mutex_};
        peers_available_ = available;
    }
    peers_cv_.notify_all();
}

void MemoryRelay::set_fail_start(bool fail) {
    std::lock_guard lock{mutex_};
    fail_start_ = fail;
}

void MemoryRelay::set_duplicates(int extra) {
    std::lock_guard lock{mutex_};
    duplicates_ = extra < 0 ? 0 : extra;
}

void MemoryRelay::set_hold(bool hold) {
    std::lock_guard lock{mutex_};
    hold_ = hold;
}

size_t MemoryRelay::flush(bool in_order) {
    std::deque<std::pair<std::string, ustring>> held;
    {
        std::lock_guard lock{mutex_};
        held.swap(held_);
    }
    if (in_order)
        for (auto& [topic, payload] : held)
            deliver(topic, payload);
    else
        for (auto it = held.rbegin(); it != held.rend(); ++it)
            deliver(it->first, it->second);
    return held.size();
}

void MemoryRelay::set_fail_publishes(bool fail) {
    std::lock_guard lock{mutex_};
    fail_publishes_ = fail;
}

void MemoryRelay::inject(const std::string& topic, ustring payload) {
    deliver(topic, payload);
}

std::vector<std::pair<std::string, ustring>> MemoryRelay::published() const {
    std::lock_guard lock{mutex_};
    return published_;
}

int MemoryRelay::running_nodes() const {
    std::lock_guard lock{mutex_};
    return running_;
}

int MemoryRelay::subscribers(const std::string& topic) const {
    std::lock_guard lock{mutex_};
    return static_cast<int>(subscriptions_.count(topic));
}

void MemoryRelay::deliver(const std::string& topic, const ustring& payload) {
    std::vector<std::shared_ptr<subscription>> targets;
    {
        std::lock_guard lock{mutex_};
        auto [begin, end] = subscriptions_.equal_range(topic);
        for (auto it = begin; it != end; ++it)
            targets.push_back(it->second);
    }

    // Handlers run outside the relay lock (so they may publish), but under the subscription's own
    // lock so that unsubscribe() can wait out an in-flight delivery.
    for (auto& sub : targets) {
        std::lock_guard lock{sub->mutex};
        if (sub->active)
            sub->handler(payload);
    }
}

MemoryRelayNode::MemoryRelayNode(std::shared_ptr<MemoryRelay> relay) : relay_{std::move(relay)} {}

MemoryRelayNode::~MemoryRelayNode() {
    stop();
}

void MemoryRelayNode::start() {
    std::lock_guard lock{relay_->mutex_};
    if (relay_->fail_start_)
        throw std::runtime_error{"Relay node failed to bootstrap"};
    if (started_)
        return;
    if (stopped_)
        throw std::logic_error{"Relay node cannot be restarted once stopped"};
    started_ = true;
    relay_->running_++;
}

bool MemoryRelayNode::wait_for_peers(
        const std::vector<Protocol>& /*protocols*/, std::chrono::milliseconds timeout) {
    std::unique_lock lock{relay_->mutex_};
    if (!started_)
        return false;
    relay_->peers_cv_.wait_for(
            lock, timeout, [this] { return stopped_ || relay_->peers_available_; });
    return !stopped_ && relay_->peers_available_;
}

void MemoryRelayNode::subscribe(const std::string& topic, payload_handler handler) {
    auto sub = std::make_shared<MemoryRelay::subscription>();
    sub->node = this;
    sub->handler = std::move(handler);

    std::lock_guard lock{relay_->mutex_};
    if (!started_ || stopped_)
        throw std::runtime_error{"Cannot subscribe: relay node is not running"};
    relay_->subscriptions_.emplace(topic, std::move(sub));
}

void MemoryRelayNode::unsubscribe(const std::string& topic) {
    std::vector<std::shared_ptr<MemoryRelay::subscription>> removed;
    {
        std::lock_guard lock{relay_->mutex_};
        auto [begin, end] = relay_->subscriptions_.equal_range(topic);
        for (auto it = begin; it != end;) {
            if (it->second->node == this) {
                removed.push_back(std::move(it->second));
                it = relay_->subscriptions_.erase(it);
            } else
                ++it;
        }
    }
    for (auto& sub : removed) {
        std::lock_guard lock{sub->mutex};
        sub->active = false;
    }
}

void MemoryRelayNode::publish(const std::string& topic, ustring payload, publish_callback done) {
    std::string error;
    bool deliver_now = false;
    int copies = 1;
    {
        std::lock_guard lock{relay_->mutex_};
        if (!started_ || stopped_)
            error = "Relay node is not running";
        else if (!relay_->peers_available_)
            error = "No light push peers available";
        else if (relay_->fail_publishes_)
            error = "Publish rejected by light push peer";
        else {
            relay_->published_.emplace_back(topic, payload);
            copies += relay_->duplicates_;
            if (relay_->hold_)
                for (int i = 0; i < copies; i++)
                    relay_->held_.emplace_back(topic, payload);
            else
                deliver_now = true;
        }
    }

    if (!error.empty()) {
        if (done)
            done(false, std::move(error));
        return;
    }

    if (deliver_now)
        for (int i = 0; i < copies; i++)
            relay_->deliver(topic, payload);

    if (done)
        done(true, "");
}

void MemoryRelayNode::stop() {
    std::vector<std::shared_ptr<MemoryRelay::subscription>> removed;
    {
        std::lock_guard lock{relay_->mutex_};
        if (stopped_)
            return;
        stopped_ = true;
        if (started_)
            relay_->running_--;

        for (auto it = relay_->subscriptions_.begin(); it != relay_->subscriptions_.end();) {
            if (it->second->node == this) {
                removed.push_back(std::move(it->second));
                it = relay_->subscriptions_.erase(it);
            } else
                ++it;
        }
    }
    relay_->peers_cv_.notify_all();

    for (auto& sub : removed) {
        std::lock_guard lock{sub->mutex};
        sub->active = false;
    }
}

}  // namespace roomchat::network

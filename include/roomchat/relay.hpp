#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace roomchat::network {

/// Relay protocols a node can need a peer for.
enum class Protocol {
    /// Publishing a message through a peer without running a full relay.
    light_push,
    /// Topic-filtered subscription served by a peer.
    filter,
};

std::string protocol_name(Protocol p);

/// Callback invoked for each payload the relay delivers on a subscribed topic.  The relay gives
/// at-least-once, unordered delivery: the same payload may arrive more than once, and payloads may
/// arrive in any order.
using payload_handler = std::function<void(ustring payload)>;

/// Callback reporting the outcome of a publish.  `error` is empty on success.
using publish_callback = std::function<void(bool success, std::string error)>;

/// A lightweight participant in a decentralized publish/subscribe relay network (for instance a
/// Waku light node).  The library does not implement a relay protocol itself; embedders provide a
/// RelayNode backed by their network stack.
///
/// Threading: `stop()` may be called from any thread and must wake a caller blocked in
/// `wait_for_peers()`.  Handlers may be invoked from any thread.
class RelayNode {
  public:
    virtual ~RelayNode() = default;

    /// Starts the node and begins bootstrapping.  May throw on failure.
    virtual void start() = 0;

    /// Blocks until the node has at least one usable peer for every protocol in `protocols`, up to
    /// `timeout`.  Returns true if peers are available, false on timeout or if the node was
    /// stopped while waiting.
    virtual bool wait_for_peers(
            const std::vector<Protocol>& protocols, std::chrono::milliseconds timeout) = 0;

    /// Subscribes to `topic`; `handler` is called for every payload published on it, including
    /// payloads published by this node.
    virtual void subscribe(const std::string& topic, payload_handler handler) = 0;

    /// Removes the subscription on `topic`, if any.  Once this returns, the handler will not be
    /// invoked again.
    virtual void unsubscribe(const std::string& topic) = 0;

    /// Sends `payload` on `topic` as a single best-effort datagram.  `done` is invoked, possibly
    /// from another thread, once the node knows whether a peer accepted it.  There is no retry.
    virtual void publish(const std::string& topic, ustring payload, publish_callback done) = 0;

    /// Stops the node and releases its network resources.  Idempotent.
    virtual void stop() = 0;
};

/// Creates a fresh, unstarted node; NetworkClient calls this once per connect attempt.
using relay_factory = std::function<std::unique_ptr<RelayNode>()>;

}  // namespace roomchat::network

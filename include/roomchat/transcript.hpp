#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "message.hpp"

namespace roomchat {

/// Delivery status of a transcript entry.  Messages this client sent move from `pending` to `sent`
/// or `failed` once the relay reports on the publish; messages from the network are `received`.
enum class SendStatus : int {
    pending = 0,
    sent = 1,
    failed = 2,
    received = 3,
};

std::string_view send_status_name(SendStatus s);

struct TranscriptEntry {
    ChatMessage message;
    bool outgoing = false;  // true if this client sent it
    SendStatus status = SendStatus::received;
};

/// The in-memory message list of a session, with duplicate suppression.
///
/// The relay delivers at least once and in no particular order, so every message id is recorded
/// in a seen set the first time it is encountered (including ids of messages this client sends,
/// which are recorded before they are published so that the relay echo is dropped).  Entries are
/// kept sorted by timestamp; messages with equal timestamps stay in the order they were added.
///
/// The seen set only ever grows.  Not thread-safe; ChatSession serializes access.
class Transcript {
  public:
    /// Records `id` as seen.  Returns false if it was already seen.
    bool mark_seen(const std::string& id);

    /// Returns true if `id` has been seen this session.
    bool seen(const std::string& id) const { return seen_.count(id) > 0; }

    size_t seen_count() const { return seen_.size(); }

    /// API: transcript/Transcript::add_incoming
    ///
    /// Adds a message received from the network.  Returns false (and changes nothing) if its id
    /// has already been seen.
    bool add_incoming(ChatMessage msg);

    /// API: transcript/Transcript::add_outgoing
    ///
    /// Adds a message this client is about to publish, marking its id seen and its status
    /// `pending`.  Throws std::invalid_argument if the id has already been seen.
    void add_outgoing(ChatMessage msg);

    /// Updates the status of the entry with the given id.  Returns false if there is no such entry.
    bool set_status(std::string_view id, SendStatus status);

    /// Marks every outgoing entry still `pending` as `failed`, returning their ids.
    std::vector<std::string> fail_pending();

    /// Returns the entry with the given id, or nullptr.  The pointer is invalidated by the next
    /// insertion.
    const TranscriptEntry* find(std::string_view id) const;

    const std::vector<TranscriptEntry>& entries() const { return entries_; }

    /// The messages alone, in display order.
    std::vector<ChatMessage> messages() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

  private:
    void insert(TranscriptEntry entry);

    std::unordered_set<std::string> seen_;
    std::vector<TranscriptEntry> entries_;
};

}  // namespace roomchat

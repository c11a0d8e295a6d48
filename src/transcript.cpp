#include "roomchat/transcript.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std::literals;

namespace roomchat {

std::string_view send_status_name(SendStatus s) {
    switch (s) {
        case SendStatus::pending: return "pending"sv;
        case SendStatus::sent: return "sent"sv;
        case SendStatus::failed: return "failed"sv;
        case SendStatus::received: return "received"sv;
    }
    return "unknown"sv;
}

bool Transcript::mark_seen(const std::string& id) {
    return seen_.insert(id).second;
}

void Transcript::insert(TranscriptEntry entry) {
    // upper_bound keeps equal timestamps in arrival order
    auto it = std::upper_bound(
            entries_.begin(),
            entries_.end(),
            entry.message.timestamp,
            [](uint64_t ts, const TranscriptEntry& e) { return ts < e.message.timestamp; });
    entries_.insert(it, std::move(entry));
}

bool Transcript::add_incoming(ChatMessage msg) {
    if (!mark_seen(msg.id))
        return false;
    TranscriptEntry entry;
    entry.message = std::move(msg);
    entry.outgoing = false;
    entry.status = SendStatus::received;
    insert(std::move(entry));
    return true;
}

void Transcript::add_outgoing(ChatMessage msg) {
    if (!mark_seen(msg.id))
        throw std::invalid_argument{"Duplicate message id " + msg.id};
    TranscriptEntry entry;
    entry.message = std::move(msg);
    entry.outgoing = true;
    entry.status = SendStatus::pending;
    insert(std::move(entry));
}

bool Transcript::set_status(std::string_view id, SendStatus status) {
    for (auto& e : entries_) {
        if (e.message.id == id) {
            e.status = status;
            return true;
        }
    }
    return false;
}

std::vector<std::string> Transcript::fail_pending() {
    std::vector<std::string> failed;
    for (auto& e : entries_) {
        if (e.outgoing && e.status == SendStatus::pending) {
            e.status = SendStatus::failed;
            failed.push_back(e.message.id);
        }
    }
    return failed;
}

const TranscriptEntry* Transcript::find(std::string_view id) const {
    for (auto& e : entries_)
        if (e.message.id == id)
            return &e;
    return nullptr;
}

std::vector<ChatMessage> Transcript::messages() const {
    std::vector<ChatMessage> result;
    result.reserve(entries_.size());
    for (auto& e : entries_)
        result.push_back(e.message);
    return result;
}

}  // namespace roomchat

#include "roomchat/reactions.hpp"

#include <algorithm>
#include <stdexcept>

namespace roomchat {

bool is_reaction_emoji(std::string_view emoji) {
    return std::find(REACTION_EMOJI.begin(), REACTION_EMOJI.end(), emoji) != REACTION_EMOJI.end();
}

bool Reactions::toggle(
        const std::string& message_id, std::string_view emoji, const std::string& user) {
    if (!is_reaction_emoji(emoji))
        throw std::invalid_argument{"Invalid reaction: not a supported emoji"};

    auto& by_emoji = reactions_[message_id];
    auto it = by_emoji.find(emoji);
    if (it == by_emoji.end())
        it = by_emoji.emplace(std::string{emoji}, std::vector<std::string>{}).first;

    auto& users = it->second;
    if (auto u = std::find(users.begin(), users.end(), user); u != users.end()) {
        users.erase(u);
        if (users.empty()) {
            by_emoji.erase(it);
            if (by_emoji.empty())
                reactions_.erase(message_id);
        }
        return false;
    }
    users.push_back(user);
    return true;
}

std::vector<Reaction> Reactions::get(const std::string& message_id) const {
    std::vector<Reaction> result;
    auto m = reactions_.find(message_id);
    if (m == reactions_.end())
        return result;
    for (auto emoji : REACTION_EMOJI) {
        auto it = m->second.find(emoji);
        if (it != m->second.end() && !it->second.empty())
            result.push_back(Reaction{std::string{emoji}, it->second});
    }
    return result;
}

bool Reactions::has_reacted(
        const std::string& message_id, std::string_view emoji, std::string_view user) const {
    auto m = reactions_.find(message_id);
    if (m == reactions_.end())
        return false;
    auto it = m->second.find(emoji);
    if (it == m->second.end())
        return false;
    return std::find(it->second.begin(), it->second.end(), user) != it->second.end();
}

}  // namespace roomchat

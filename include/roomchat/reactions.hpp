#pragma once

#include <array>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace roomchat {

/// The emoji a message can be reacted to with, in display order: 👍 ❤️ 😂 😮 😢 🔥
inline constexpr std::array<std::string_view, 6> REACTION_EMOJI = {
        "\xF0\x9F\x91\x8D",
        "\xE2\x9D\xA4\xEF\xB8\x8F",
        "\xF0\x9F\x98\x82",
        "\xF0\x9F\x98\xAE",
        "\xF0\x9F\x98\xA2",
        "\xF0\x9F\x94\xA5",
};

/// Returns true if `emoji` is one of REACTION_EMOJI.
bool is_reaction_emoji(std::string_view emoji);

struct Reaction {
    std::string emoji;
    std::vector<std::string> users;  // display names, in the order they reacted

    bool operator==(const Reaction& other) const {
        return emoji == other.emoji && users == other.users;
    }
    bool operator!=(const Reaction& other) const { return !(*this == other); }
};

/// Reactions to transcript messages.  Reactions are local to this client: they are not published
/// to the room, so each participant only sees their own.  Not thread-safe.
class Reactions {
  public:
    /// API: reactions/Reactions::toggle
    ///
    /// Adds `user`'s `emoji` reaction to `message_id`, or removes it if already present.
    ///
    /// Inputs:
    /// - `message_id` -- the message being reacted to
    /// - `emoji` -- one of REACTION_EMOJI
    /// - `user` -- the reacting display name
    ///
    /// Outputs:
    /// - `bool` -- true if the reaction was added, false if it was removed.
    ///
    /// Throws std::invalid_argument if `emoji` is not in the palette.
    bool toggle(const std::string& message_id, std::string_view emoji, const std::string& user);

    /// Returns the reactions on `message_id` with at least one user, in palette order.
    std::vector<Reaction> get(const std::string& message_id) const;

    /// Returns true if `user` currently reacts to `message_id` with `emoji`.
    bool has_reacted(
            const std::string& message_id, std::string_view emoji, std::string_view user) const;

  private:
    // message id -> emoji -> users
    std::map<std::string, std::map<std::string, std::vector<std::string>, std::less<>>> reactions_;
};

}  // namespace roomchat

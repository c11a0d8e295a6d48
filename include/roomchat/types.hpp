#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace roomchat {

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

namespace room {

    // Symmetric room key; the SHA-256 digest of the domain-prefixed canonical room code.
    using Key = std::array<unsigned char, 32>;

}  // namespace room

}  // namespace roomchat

#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace roomchat::room {

using namespace std::literals;

/// Domain separation prefix hashed in front of the canonical code when deriving the room key.
inline constexpr auto KEY_PREFIX = "spritz-instant-room-"sv;

/// Components of the content topic: /APP_PREFIX/PROTOCOL_VERSION/instant-room/CODE/FORMAT_TAG
inline constexpr auto APP_PREFIX = "spritz"sv;
inline constexpr auto PROTOCOL_VERSION = "1"sv;
inline constexpr auto TOPIC_KIND = "instant-room"sv;
inline constexpr auto FORMAT_TAG = "proto"sv;

/// Maximum length (in bytes) of a canonical room code.
inline constexpr size_t MAX_CODE_LENGTH = 64;

/// Alphabet used by `generate_code`; leaves out characters that are easily confused when read
/// aloud or typed (0/O, 1/I).
inline constexpr auto CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789"sv;

/// API: room/canonical_code
///
/// Returns the canonical form of a room code: the code with its letters uppercased.  Every other
/// derivation in this namespace operates on this form, so "abcd12" and "ABCD12" name the same
/// room.  Whitespace is kept as is: " BLUE42" names a different room than "BLUE42", as it does
/// for every other client of the room, so callers that take codes from user input should trim
/// them first.
///
/// Throws std::invalid_argument if the code is empty, longer than MAX_CODE_LENGTH, or contains a
/// `/` or a control character (either of which would break the topic string).  Codes with
/// non-ASCII characters are also rejected: other clients uppercase those with the full Unicode
/// case mapping, which is not reproduced here, so such a code would silently name a different
/// room.
std::string canonical_code(std::string_view code);

/// API: room/derive_key
///
/// Derives the symmetric room key: SHA-256(KEY_PREFIX + canonical_code(code)).
///
/// Knowledge of the code *is* the shared secret; there is no interactive exchange.  Since the
/// derivation is public, the key is exactly as strong as the code is unguessable: a short or
/// predictable code can be brute-forced offline by anyone watching the topic.
///
/// Inputs:
/// - `code` -- the room code, in any case.
///
/// Outputs:
/// - the 32 byte room key.  Throws std::invalid_argument if the code is not valid.
Key derive_key(std::string_view code);

/// API: room/content_topic
///
/// Returns the public routing topic for the room, e.g. `/spritz/1/instant-room/BLUE42/proto`.  The
/// topic only partitions traffic on the relay; it is not secret and grants no access.
///
/// Throws std::invalid_argument if the code is not valid.
std::string content_topic(std::string_view code);

/// API: room/generate_code
///
/// Generates a fresh random room code of `length` characters drawn from CODE_ALPHABET.  Each
/// character carries 5 bits of entropy.
///
/// Throws std::invalid_argument if `length` is 0 or larger than MAX_CODE_LENGTH.
std::string generate_code(size_t length = 6);

}  // namespace roomchat::room

#pragma once

#include <array>

#include "types.hpp"

namespace roomchat::hash {

/// API: hash/sha256
///
/// Wrapper around the crypto_hash_sha256 function.
///
/// Inputs:
/// - `msg` -- the message to generate a hash for.
///
/// Outputs:
/// - the 32 byte SHA-256 digest of `msg`.
std::array<unsigned char, 32> sha256(ustring_view msg);

}  // namespace roomchat::hash

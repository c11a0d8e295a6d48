#pragma once

#include "types.hpp"

namespace roomchat::random {

/// API: random/random
///
/// Wrapper around the randombytes_buf function.
///
/// Inputs:
/// - `size` -- the number of random bytes to be generated.
///
/// Outputs:
/// - random bytes of the specified length.
ustring random(size_t size);

/// API: random/uniform
///
/// Returns a uniformly distributed random value in [0, upper_bound) using randombytes_uniform.
uint32_t uniform(uint32_t upper_bound);

}  // namespace roomchat::random

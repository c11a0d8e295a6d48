#include "roomchat/random.hpp"

#include <sodium/randombytes.h>

namespace roomchat::random {

ustring random(size_t size) {
    ustring result;
    result.resize(size);
    randombytes_buf(result.data(), size);

    return result;
}

uint32_t uniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

}  // namespace roomchat::random

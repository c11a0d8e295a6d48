#include "roomchat/hash.hpp"

#include <sodium/crypto_hash_sha256.h>

namespace roomchat::hash {

static_assert(crypto_hash_sha256_BYTES == 32);

std::array<unsigned char, 32> sha256(ustring_view msg) {
    std::array<unsigned char, 32> result;
    crypto_hash_sha256(result.data(), msg.data(), msg.size());
    return result;
}

}  // namespace roomchat::hash

#include "roomchat/envelope.hpp"

#include <nettle/gcm.h>
#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <algorithm>
#include <array>
#include <cassert>

namespace roomchat::envelope {

static_assert(IV_SIZE == GCM_IV_SIZE);
static_assert(TAG_SIZE == GCM_DIGEST_SIZE);
static_assert(std::tuple_size_v<room::Key> == AES256_KEY_SIZE);

ustring frame(ustring_view payload) {
    auto field_len = size_field_length(payload.size());
    // A 4-byte field would not fit in the flag bits
    if (field_len > FLAG_SIZE_MASK)
        throw std::invalid_argument{"frame called with a payload that is too large"};

    ustring msg;
    msg.resize(padded_size(payload.size()));
    auto* o = msg.data();
    *o++ = static_cast<unsigned char>(field_len);
    for (size_t i = 0, s = payload.size(); i < field_len; i++, s >>= 8)
        *o++ = static_cast<unsigned char>(s & 0xff);
    std::copy(payload.begin(), payload.end(), o);
    o += payload.size();
    randombytes_buf(o, msg.data() + msg.size() - o);
    return msg;
}

ustring unframe(ustring_view envelope) {
    if (envelope.empty())
        throw decrypt_error{"Invalid envelope: no data"};

    size_t field_len = envelope[0] & FLAG_SIZE_MASK;
    if (field_len == 0)
        throw decrypt_error{"Invalid envelope: missing payload size"};
    if (envelope.size() < 1 + field_len)
        throw decrypt_error{"Invalid envelope: truncated payload size"};

    size_t len = 0;
    for (size_t i = field_len; i > 0; i--)
        len = (len << 8) | envelope[i];

    envelope.remove_prefix(1 + field_len);
    if (len > envelope.size())
        throw decrypt_error{"Invalid envelope: payload size exceeds envelope"};
    return ustring{envelope.substr(0, len)};
}

ustring encrypt(ustring_view plaintext, const room::Key& key) {
    // Initialise cipher context with the key
    struct gcm_aes256_ctx ctx;
    gcm_aes256_set_key(&ctx, key.data());

    ustring output;
    output.resize(plaintext.size() + ENCRYPT_DATA_OVERHEAD);

    // The IV goes at the end, after the ciphertext and digest
    auto* iv = output.data() + plaintext.size() + GCM_DIGEST_SIZE;
    randombytes_buf(iv, GCM_IV_SIZE);
    gcm_aes256_set_iv(&ctx, GCM_IV_SIZE, iv);

    auto* o = output.data();
    gcm_aes256_encrypt(&ctx, plaintext.size(), o, plaintext.data());
    o += plaintext.size();

    gcm_aes256_digest(&ctx, GCM_DIGEST_SIZE, o);
    o += GCM_DIGEST_SIZE;

    assert(o == iv);
    return output;
}

ustring decrypt(ustring_view ciphertext, const room::Key& key) {
    if (ciphertext.size() < ENCRYPT_DATA_OVERHEAD)
        throw decrypt_error{"Decryption failed: ciphertext is too short"};

    auto iv = ciphertext.substr(ciphertext.size() - GCM_IV_SIZE);
    ciphertext.remove_suffix(GCM_IV_SIZE);
    auto digest_in = ciphertext.substr(ciphertext.size() - GCM_DIGEST_SIZE);
    ciphertext.remove_suffix(GCM_DIGEST_SIZE);

    struct gcm_aes256_ctx ctx;
    gcm_aes256_set_key(&ctx, key.data());
    gcm_aes256_set_iv(&ctx, GCM_IV_SIZE, iv.data());

    ustring plaintext;
    plaintext.resize(ciphertext.size());
    gcm_aes256_decrypt(&ctx, ciphertext.size(), plaintext.data(), ciphertext.data());

    std::array<uint8_t, GCM_DIGEST_SIZE> digest_out;
    gcm_aes256_digest(&ctx, digest_out.size(), digest_out.data());

    if (sodium_memcmp(digest_out.data(), digest_in.data(), GCM_DIGEST_SIZE) != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        throw decrypt_error{"Message decryption failed"};
    }

    return plaintext;
}

ustring seal(ustring_view payload, const room::Key& key) {
    auto framed = frame(payload);
    auto sealed = encrypt(framed, key);
    sodium_memzero(framed.data(), framed.size());
    return sealed;
}

ustring open(ustring_view sealed, const room::Key& key) {
    return unframe(decrypt(sealed, key));
}

Encoder::Encoder(std::string topic, const room::Key& key) : topic_{std::move(topic)}, key_{key} {}

ustring Encoder::encode(const ChatMessage& msg) const {
    return seal(message::encode(msg), key_);
}

Decoder::Decoder(std::string topic, const room::Key& key) : topic_{std::move(topic)}, key_{key} {}

message::decode_result Decoder::decode(ustring_view payload) const {
    ustring plain;
    try {
        plain = open(payload, key_);
    } catch (const decrypt_error& e) {
        return message::decode_error{e.what()};
    }
    return message::try_decode(plain);
}

}  // namespace roomchat::envelope

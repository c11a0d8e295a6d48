#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "message.hpp"
#include "types.hpp"
#include "util.hpp"

namespace roomchat::envelope {

// Sealed payloads use the Waku symmetric ("version 1") payload encryption, so that they can be
// exchanged with any other client of the same room.

/// Size of the random AES-256-GCM IV appended to a sealed payload.
constexpr size_t IV_SIZE = 12;

/// Size of the GCM authentication tag.
constexpr size_t TAG_SIZE = 16;

/// Constant amount of extra bytes appended when encrypting (TAG_SIZE + IV_SIZE).
constexpr size_t ENCRYPT_DATA_OVERHEAD = TAG_SIZE + IV_SIZE;

/// The plaintext envelope is padded to a multiple of this many bytes.
constexpr size_t PADDING_TARGET = 256;

/// Low bits of the flags byte holding the length of the payload size field.
constexpr unsigned char FLAG_SIZE_MASK = 0x03;

/// Flag bit set when the envelope carries a trailing signature.
constexpr unsigned char FLAG_SIGNED = 0x04;

/// Length of the trailing signature of a signed envelope.
constexpr size_t SIGNATURE_SIZE = 65;

/// Returns the number of bytes (1-4) used to store a payload length of `s` in the envelope.
inline constexpr size_t size_field_length(size_t s) {
    size_t n = 1;
    for (; s >= 256; s /= 256)
        n++;
    return n;
}

/// Returns the size of the plaintext envelope holding a payload of `s` bytes: one flags byte, the
/// payload size field, the payload and random padding up to the next multiple of PADDING_TARGET.
/// A size that is already a multiple still gets a full PADDING_TARGET of padding.
inline constexpr size_t padded_size(size_t s) {
    size_t raw = 1 + size_field_length(s) + s;
    return raw + PADDING_TARGET - raw % PADDING_TARGET;
}

/// Thrown if open(), decrypt() or unframe() fails.
struct decrypt_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// API: envelope/frame
///
/// Builds the plaintext envelope for a payload:
///
///     flags || payload size (little-endian, 1-3 bytes) || payload || random padding
///
/// where the low two bits of `flags` hold the length of the size field.  The result is
/// `padded_size(payload.size())` bytes long.  Throws std::invalid_argument if the payload is too
/// large to be described by a 3-byte size field.
ustring frame(ustring_view payload);

/// API: envelope/unframe
///
/// Extracts the payload from a plaintext envelope built by `frame()` (or by another client).
/// Signatures on signed envelopes are not verified.  Throws decrypt_error on a malformed
/// envelope.
ustring unframe(ustring_view envelope);

/// API: envelope/encrypt
///
/// Encrypts `plaintext` with AES-256-GCM under `key` with a random IV and no associated data.
///
/// Outputs:
/// - `ciphertext || tag || iv`, that is `plaintext.size() + ENCRYPT_DATA_OVERHEAD` bytes.
ustring encrypt(ustring_view plaintext, const room::Key& key);

/// API: envelope/decrypt
///
/// Reverses `encrypt()`.  Throws decrypt_error if the value is too short or fails to
/// authenticate.
ustring decrypt(ustring_view ciphertext, const room::Key& key);

/// API: envelope/seal
///
/// Frames, pads and encrypts a payload for the room: `encrypt(frame(payload), key)`.  The sealed
/// size reveals only a multiple of PADDING_TARGET.
ustring seal(ustring_view payload, const room::Key& key);

/// API: envelope/open
///
/// Takes a value produced by `seal()` and returns the original payload.  Throws decrypt_error if
/// the value is too short, fails to authenticate, or carries an invalid envelope.
ustring open(ustring_view sealed, const room::Key& key);

/// Turns chat messages into sealed relay payloads for one {topic, key} pair.
class Encoder {
  public:
    Encoder(std::string topic, const room::Key& key);

    const std::string& topic() const { return topic_; }

    /// Encodes and seals `msg`.  Throws std::invalid_argument if the message cannot be encoded.
    ustring encode(const ChatMessage& msg) const;

  private:
    std::string topic_;
    sodium_cleared<room::Key> key_;
};

/// Turns sealed relay payloads back into chat messages for one {topic, key} pair.
class Decoder {
  public:
    Decoder(std::string topic, const room::Key& key);

    const std::string& topic() const { return topic_; }

    /// Opens and decodes a relay payload.  Decryption failures are reported as a decode_error,
    /// since on a public topic a payload sealed with another key is just another malformed
    /// message.
    message::decode_result decode(ustring_view payload) const;

  private:
    std::string topic_;
    sodium_cleared<room::Key> key_;
};

}  // namespace roomchat::envelope

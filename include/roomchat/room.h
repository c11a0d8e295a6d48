#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

#include "export.h"

/// Size of a room key, in bytes.
#define ROOM_KEY_BYTES 32

/// Size of a buffer large enough for any content topic, including the null terminator.
#define ROOM_TOPIC_MAX_LENGTH 112

/// API: room/room_derive_key
///
/// Derives the 32-byte symmetric key for a room code (case-insensitive).
///
/// Inputs:
/// - `code` -- [in] null-terminated room code.
/// - `key_out` -- [out] pointer to a buffer of at least ROOM_KEY_BYTES bytes where the key will be
///   written.
///
/// Outputs:
/// - `bool` -- True if the key was derived, false if the code is invalid.
LIBROOMCHAT_EXPORT bool room_derive_key(const char* code, unsigned char* key_out);

/// API: room/room_content_topic
///
/// Writes the null-terminated content topic for a room code into `topic_out`.
///
/// Inputs:
/// - `code` -- [in] null-terminated room code.
/// - `topic_out` -- [out] buffer for the topic; ROOM_TOPIC_MAX_LENGTH bytes is always enough.
/// - `topic_len` -- [in] size of `topic_out`.
///
/// Outputs:
/// - `bool` -- True on success; false if the code is invalid or the buffer is too small.
LIBROOMCHAT_EXPORT bool room_content_topic(const char* code, char* topic_out, size_t topic_len);

/// API: room/room_generate_code
///
/// Generates a random room code of `length` characters.
///
/// Inputs:
/// - `length` -- [in] number of characters (1-64).
/// - `code_out` -- [out] buffer of at least `length + 1` bytes for the null-terminated code.
///
/// Outputs:
/// - `bool` -- True on success, false if `length` is out of range.
LIBROOMCHAT_EXPORT bool room_generate_code(size_t length, char* code_out);

#ifdef __cplusplus
}
#endif

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

#include "types.hpp"

namespace roomchat {

// Helper function to go to/from char pointers to unsigned char pointers:
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline unsigned char* to_unsigned(char* x) {
    return reinterpret_cast<unsigned char*>(x);
}
inline const char* from_unsigned(const unsigned char* x) {
    return reinterpret_cast<const char*>(x);
}
inline char* from_unsigned(unsigned char* x) {
    return reinterpret_cast<char*>(x);
}
// Helper function to switch between std::string_view and ustring_view
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline ustring_view to_unsigned_sv(ustring_view v) {
    return v;  // no-op, but helps with template metaprogamming
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {from_unsigned(v.data()), v.size()};
}
template <size_t N>
inline std::string_view from_unsigned_sv(const std::array<unsigned char, N>& v) {
    return {from_unsigned(v.data()), v.size()};
}

/// Milliseconds since the unix epoch, as carried in the message `timestamp` field.
inline uint64_t get_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
}

// C++20 starts_/ends_with backport
inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

inline constexpr bool ends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

/// Returns `s` with leading and trailing ASCII whitespace removed.
inline std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos)
        return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

/// Returns true if `s` is well-formed UTF-8 (no overlong forms, surrogates, or values above
/// U+10FFFF).
bool is_utf8(std::string_view s);

/// Returns the length of a valid UTF-8 string in UTF-16 code units: code points above U+FFFF
/// count twice.
size_t utf16_length(std::string_view s);

/// Returns the longest prefix of `s` whose UTF-16 length is at most `max_units`.  Never splits a
/// code point: one that would only half fit is left out.  `s` must be valid UTF-8.
std::string_view utf16_truncate(std::string_view s, size_t max_units);

// Calls sodium_memzero to zero a buffer
void sodium_zero_buffer(void* ptr, size_t size);

// Wrapper around a type that uses `sodium_memzero` to zero the container on destruction; may only
// be used with trivially destructible types.
template <typename T, typename = std::enable_if_t<std::is_trivially_destructible_v<T>>>
struct sodium_cleared : T {
    using T::T;

    sodium_cleared() = default;
    sodium_cleared(const T& from) : T{from} {}

    ~sodium_cleared() { sodium_zero_buffer(this, sizeof(*this)); }
};

}  // namespace roomchat

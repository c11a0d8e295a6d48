#include <sodium/utils.h>

#include <roomchat/util.hpp>

namespace roomchat {

void sodium_zero_buffer(void* ptr, size_t size) {
    if (ptr)
        sodium_memzero(ptr, size);
}

namespace {

    // Returns the length of the UTF-8 sequence starting at s[i], or 0 if it is not a valid
    // sequence.
    size_t utf8_seq_len(std::string_view s, size_t i) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80)
            return 1;
        else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else
            return 0;

        if (i + len > s.size())
            return 0;
        for (size_t j = 1; j < len; j++) {
            auto cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80)
                return 0;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Reject overlong encodings, UTF-16 surrogates and anything past the unicode range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return 0;
        return len;
    }

}  // namespace

bool is_utf8(std::string_view s) {
    for (size_t i = 0; i < s.size();) {
        auto len = utf8_seq_len(s, i);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

size_t utf16_length(std::string_view s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size();) {
        auto len = utf8_seq_len(s, i);
        // 4-byte sequences are the code points outside the BMP, encoded as a surrogate pair
        n += len == 4 ? 2 : 1;
        i += len ? len : 1;
    }
    return n;
}

std::string_view utf16_truncate(std::string_view s, size_t max_units) {
    size_t i = 0;
    for (size_t n = 0; i < s.size();) {
        auto len = utf8_seq_len(s, i);
        size_t units = len == 4 ? 2 : 1;
        if (n + units > max_units)
            break;
        n += units;
        i += len ? len : 1;
    }
    return s.substr(0, i);
}

}  // namespace roomchat

#include "roomchat/room.hpp"

#include <sodium/core.h>

#include <stdexcept>

#include "roomchat/export.h"
#include "roomchat/hash.hpp"
#include "roomchat/random.hpp"
#include "roomchat/room.h"
#include "roomchat/util.hpp"

namespace roomchat::room {

std::string canonical_code(std::string_view code) {
    if (code.empty())
        throw std::invalid_argument{"Invalid room code: code is empty"};
    if (code.size() > MAX_CODE_LENGTH)
        throw std::invalid_argument{
                "Invalid room code: expected at most " + std::to_string(MAX_CODE_LENGTH) +
                " bytes; got " + std::to_string(code.size())};

    std::string canonical;
    canonical.reserve(code.size());
    for (char c : code) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '/' || uc < 0x20 || uc == 0x7f)
            throw std::invalid_argument{"Invalid room code: contains '/' or a control character"};
        if (uc >= 0x80)
            throw std::invalid_argument{"Invalid room code: only ASCII codes are supported"};
        if (c >= 'a' && c <= 'z')
            c -= ('a' - 'A');
        canonical += c;
    }
    return canonical;
}

Key derive_key(std::string_view code) {
    std::string material{KEY_PREFIX};
    material += canonical_code(code);
    return hash::sha256(to_unsigned_sv(material));
}

std::string content_topic(std::string_view code) {
    auto canonical = canonical_code(code);

    std::string topic;
    topic.reserve(
            APP_PREFIX.size() + PROTOCOL_VERSION.size() + TOPIC_KIND.size() + canonical.size() +
            FORMAT_TAG.size() + 5);
    topic += '/';
    topic += APP_PREFIX;
    topic += '/';
    topic += PROTOCOL_VERSION;
    topic += '/';
    topic += TOPIC_KIND;
    topic += '/';
    topic += canonical;
    topic += '/';
    topic += FORMAT_TAG;
    return topic;
}

std::string generate_code(size_t length) {
    if (length == 0 || length > MAX_CODE_LENGTH)
        throw std::invalid_argument{"generate_code called with an invalid length"};
    if (sodium_init() == -1)
        throw std::runtime_error{"libsodium initialization failed!"};

    std::string code;
    code.reserve(length);
    for (size_t i = 0; i < length; i++)
        code += CODE_ALPHABET[random::uniform(CODE_ALPHABET.size())];
    return code;
}

}  // namespace roomchat::room

extern "C" {

LIBROOMCHAT_C_API bool room_derive_key(const char* code, unsigned char* key_out) {
    try {
        auto key = roomchat::room::derive_key(code);
        std::memcpy(key_out, key.data(), key.size());
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

LIBROOMCHAT_C_API bool room_content_topic(const char* code, char* topic_out, size_t topic_len) {
    try {
        auto topic = roomchat::room::content_topic(code);
        if (topic.size() + 1 > topic_len)
            return false;
        std::memcpy(topic_out, topic.c_str(), topic.size() + 1);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

LIBROOMCHAT_C_API bool room_generate_code(size_t length, char* code_out) {
    try {
        auto code = roomchat::room::generate_code(length);
        std::memcpy(code_out, code.c_str(), code.size() + 1);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // extern "C"

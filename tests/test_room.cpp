#include <rapidcheck.h>

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "rapidcheck/catch.h"
#include "roomchat/room.h"
#include "roomchat/room.hpp"
#include "utils.hpp"

using namespace roomchat;

TEST_CASE("Room key derivation", "[room][derive_key]") {
    // SHA-256("spritz-instant-room-BLUE42")
    CHECK(to_hex(room::derive_key("BLUE42")) ==
          "2928b471eefc735401eae108b8105542dd0195d6c3b5c38e5f5b1874edad85bb");
    CHECK(to_hex(room::derive_key("ABCD12")) ==
          "9ca7790700f8bf389f016318cd6c7ed12b13eea30be09f32ce7e5aff7b87298b");
    CHECK(to_hex(room::derive_key("ABCD13")) ==
          "31310e13490e04020243c0a96226eedca25321a4e7b592b9b91d643ba4abfdb5");

    // Codes are case-insensitive, but whitespace is part of the code
    CHECK(room::derive_key("blue42") == room::derive_key("BLUE42"));
    CHECK(room::derive_key("Blue42") == room::derive_key("BLUE42"));
    CHECK(room::derive_key(" blue42") != room::derive_key("BLUE42"));
    // SHA-256("spritz-instant-room- BLUE42")
    CHECK(to_hex(room::derive_key(" blue42")) ==
          "128d28b7004ea0ac3a6536aa61a48ae213d6cc751cda6bd152efbb030754b6a1");

    CHECK(room::derive_key("ABCD12") != room::derive_key("ABCD13"));
}

TEST_CASE("Room key derivation properties", "[room][derive_key]") {
    rc::prop("same code gives same key and topic", [](const std::string& suffix) {
        auto code = "R" + suffix;
        RC_PRE(code.size() <= room::MAX_CODE_LENGTH);
        RC_PRE(code.find('/') == std::string::npos);
        RC_PRE(std::none_of(code.begin(), code.end(), [](char c) {
            auto uc = static_cast<unsigned char>(c);
            return uc < 0x20 || uc >= 0x7f;
        }));

        RC_ASSERT(room::derive_key(code) == room::derive_key(code));
        RC_ASSERT(room::content_topic(code) == room::content_topic(code));
        RC_ASSERT(room::derive_key(code) == room::derive_key(room::canonical_code(code)));
    });

    rc::prop("different codes give different keys and topics", []() {
        auto a = *rc::gen::container<std::string>(
                6, rc::gen::elementOf(std::string{room::CODE_ALPHABET}));
        auto b = *rc::gen::container<std::string>(
                6, rc::gen::elementOf(std::string{room::CODE_ALPHABET}));
        RC_PRE(a != b);
        RC_ASSERT(room::derive_key(a) != room::derive_key(b));
        RC_ASSERT(room::content_topic(a) != room::content_topic(b));
    });
}

TEST_CASE("Room content topic", "[room][content_topic]") {
    CHECK(room::content_topic("BLUE42") == "/spritz/1/instant-room/BLUE42/proto");
    CHECK(room::content_topic("blue42") == "/spritz/1/instant-room/BLUE42/proto");
    CHECK(room::content_topic("x7") == "/spritz/1/instant-room/X7/proto");
    CHECK(room::content_topic(" x7 ") == "/spritz/1/instant-room/ X7 /proto");
}

TEST_CASE("Room code validation", "[room][canonical_code]") {
    CHECK(room::canonical_code("abc") == "ABC");
    CHECK(room::canonical_code(" AbC ") == " ABC ");
    CHECK(room::canonical_code("r00m-7_x") == "R00M-7_X");

    CHECK_THROWS_AS(room::canonical_code(""), std::invalid_argument);
    CHECK_THROWS_AS(room::canonical_code("\tABC"), std::invalid_argument);
    CHECK_THROWS_AS(room::canonical_code("ABC\n"), std::invalid_argument);
    CHECK_THROWS_AS(room::canonical_code("caf\xc3\xa9"), std::invalid_argument);
    CHECK_THROWS_AS(room::derive_key("\xc3\x9f"), std::invalid_argument);
    CHECK_THROWS_AS(room::canonical_code("a/b"), std::invalid_argument);
    CHECK_THROWS_AS(room::canonical_code("a\x01"
                                         "b"),
                    std::invalid_argument);
    CHECK_THROWS_AS(room::derive_key(""), std::invalid_argument);
    CHECK_THROWS_AS(room::content_topic("ROOM/../OTHER"), std::invalid_argument);

    std::string longest(room::MAX_CODE_LENGTH, 'A');
    CHECK_NOTHROW(room::canonical_code(longest));
    CHECK_THROWS_AS(room::canonical_code(longest + "A"), std::invalid_argument);
}

TEST_CASE("Room code generation", "[room][generate_code]") {
    auto code = room::generate_code();
    CHECK(code.size() == 6);
    for (char c : code)
        CHECK(room::CODE_ALPHABET.find(c) != std::string_view::npos);
    CHECK(room::canonical_code(code) == code);

    CHECK(room::generate_code(12).size() == 12);
    CHECK(room::generate_code(1).size() == 1);
    CHECK_THROWS_AS(room::generate_code(0), std::invalid_argument);
    CHECK_THROWS_AS(room::generate_code(room::MAX_CODE_LENGTH + 1), std::invalid_argument);

    std::set<std::string> codes;
    for (int i = 0; i < 50; i++)
        codes.insert(room::generate_code(10));
    CHECK(codes.size() == 50);
}

TEST_CASE("Room C API", "[room][c]") {
    unsigned char key[ROOM_KEY_BYTES];
    REQUIRE(room_derive_key("blue42", key));
    CHECK(to_hex(ustring_view{key, sizeof(key)}) ==
          "2928b471eefc735401eae108b8105542dd0195d6c3b5c38e5f5b1874edad85bb");
    CHECK_FALSE(room_derive_key("", key));

    char topic[ROOM_TOPIC_MAX_LENGTH];
    REQUIRE(room_content_topic("blue42", topic, sizeof(topic)));
    CHECK(std::string{topic} == "/spritz/1/instant-room/BLUE42/proto");
    CHECK_FALSE(room_content_topic("a/b", topic, sizeof(topic)));
    char small[10];
    CHECK_FALSE(room_content_topic("blue42", small, sizeof(small)));

    std::string longest(room::MAX_CODE_LENGTH, 'Z');
    REQUIRE(room_content_topic(longest.c_str(), topic, sizeof(topic)));
    CHECK(std::strlen(topic) < ROOM_TOPIC_MAX_LENGTH);

    char code[9];
    REQUIRE(room_generate_code(8, code));
    CHECK(std::strlen(code) == 8);
    CHECK_FALSE(room_generate_code(0, code));
}

#include <rapidcheck.h>

#include <catch2/catch_test_macros.hpp>
#include <variant>

#include "rapidcheck/catch.h"
#include "roomchat/message.hpp"
#include "roomchat/util.hpp"
#include "utils.hpp"

using namespace roomchat;

namespace {

ChatMessage sample_message() {
    ChatMessage m;
    m.id = "1700000000000-k3j9x2a";
    m.sender = "alice";
    m.content = "hi";
    m.timestamp = 1700000000000;
    return m;
}

// Printable ASCII plus newlines and tabs
rc::Gen<std::string> gen_text() {
    return rc::gen::container<std::string>(rc::gen::oneOf(
            rc::gen::inRange<char>(0x20, 0x7f),
            rc::gen::element('\n', '\t')));
}

}  // namespace

TEST_CASE("Message encoding", "[message][encode]") {
    auto m = sample_message();
    auto encoded = message::encode(m);

    // Fields 1-4 only, exactly as peers without reply support produce them
    CHECK(to_hex(encoded) ==
          "0880d095ffbc311205616c6963651a026869"
          "2215313730303030303030303030302d6b336a39783261");
    CHECK(message::decode(encoded) == m);

    m.reply_to = ReplyPreview{"1699999999000-aaaa", "bob", "hello there"};
    CHECK(to_hex(message::encode(m)) ==
          "0880d095ffbc311205616c6963651a0268692215313730303030303030303030302d6b336a397832612a"
          "260a12313639393939393939393030302d616161611203626f621a0b68656c6c6f207468657265");
    CHECK(message::decode(message::encode(m)) == m);
}

TEST_CASE("Message decoding of legacy payloads", "[message][decode]") {
    auto expected = sample_message();

    auto decoded = message::decode(
            "0880d095ffbc311205616c6963651a026869"
            "2215313730303030303030303030302d6b336a39783261"_hexbytes);
    CHECK(decoded == expected);
    CHECK_FALSE(decoded.reply_to);

    // Field order on the wire doesn't matter
    CHECK(message::decode("2215313730303030303030303030302d6b336a397832611a0268691205616c696365088"
                          "0d095ffbc31"_hexbytes) == expected);

    // Unknown fields (9: varint 42, 10: "future") from newer peers are skipped
    CHECK(message::decode("0880d095ffbc311205616c6963651a0268692215313730303030303030303030302d6b33"
                          "6a39783261482a5206667574757265"_hexbytes) == expected);
}

TEST_CASE("Message decoding failures", "[message][decode]") {
    // Not protobuf at all
    CHECK_THROWS_AS(message::decode("ffffffff"_hexbytes), message::decode_error);
    CHECK_THROWS_AS(message::decode("hello world"_bytes), message::decode_error);

    // Missing messageId
    CHECK_THROWS_AS(
            message::decode("0880d095ffbc311205616c6963651a026869"_hexbytes),
            message::decode_error);
    // Empty messageId
    CHECK_THROWS_AS(
            message::decode("0880d095ffbc311205616c6963651a0268692200"_hexbytes),
            message::decode_error);
    // Content that is not UTF-8
    CHECK_THROWS_AS(
            message::decode("0880d095ffbc311205616c6963651a01ff220178"_hexbytes),
            message::decode_error);
    // Empty payload: every required field is missing
    CHECK_THROWS_AS(message::decode(ustring_view{}), message::decode_error);

    auto result = message::try_decode("0880d095ffbc311205616c6963651a026869"_hexbytes);
    REQUIRE(std::holds_alternative<message::decode_error>(result));
    CHECK(std::string{std::get<message::decode_error>(result).what()}.find("missing") !=
          std::string::npos);

    auto ok = message::try_decode(message::encode(sample_message()));
    REQUIRE(std::holds_alternative<ChatMessage>(ok));
    CHECK(std::get<ChatMessage>(ok) == sample_message());
}

TEST_CASE("Message field limits", "[message][encode]") {
    auto m = sample_message();
    m.id.clear();
    CHECK_THROWS_AS(message::encode(m), std::invalid_argument);

    m = sample_message();
    m.id = std::string(message::MAX_ID_LENGTH + 1, 'x');
    CHECK_THROWS_AS(message::encode(m), std::invalid_argument);

    m = sample_message();
    m.sender = std::string(message::MAX_SENDER_LENGTH + 1, 'x');
    CHECK_THROWS_AS(message::encode(m), std::invalid_argument);

    m = sample_message();
    m.content = std::string(message::MAX_CONTENT_LENGTH, 'x');
    CHECK_NOTHROW(message::encode(m));
    m.content += 'x';
    CHECK_THROWS_AS(message::encode(m), std::invalid_argument);

    m = sample_message();
    m.content = "bad \xc0\xaf utf8";
    CHECK_THROWS_AS(message::encode(m), std::invalid_argument);

    m = sample_message();
    m.reply_to = ReplyPreview{"id", "bob", "\xed\xa0\x80"};  // surrogate
    CHECK_THROWS_AS(message::validate(m), std::invalid_argument);
}

TEST_CASE("Message round trip", "[message][encode][decode]") {
    rc::prop("decode(encode(m)) == m", [](uint64_t timestamp) {
        ChatMessage m;
        m.timestamp = timestamp;
        m.id = message::generate_id(timestamp);
        m.sender = *gen_text();
        m.content = *gen_text();
        if (*rc::gen::arbitrary<bool>())
            m.reply_to = ReplyPreview{
                    message::generate_id(timestamp), *gen_text(), *gen_text()};
        RC_PRE(m.sender.size() <= message::MAX_SENDER_LENGTH);
        RC_PRE(m.content.size() <= message::MAX_CONTENT_LENGTH);

        RC_ASSERT(message::decode(message::encode(m)) == m);
    });

    // Multi-byte content survives untouched
    auto m = sample_message();
    m.content = "\xf0\x9f\x94\xa5 caf\xc3\xa9 \xe2\x86\xa9\xef\xb8\x8f";
    CHECK(message::decode(message::encode(m)) == m);
}

TEST_CASE("Message ids", "[message][generate_id]") {
    auto id = message::generate_id(1700000000000);
    REQUIRE(id.size() == 13 + 1 + 16);
    CHECK(starts_with(id, "1700000000000-"));
    CHECK(oxenc::is_hex(id.substr(14)));

    std::set<std::string> ids;
    for (int i = 0; i < 1000; i++)
        ids.insert(message::generate_id(42));
    CHECK(ids.size() == 1000);
}

TEST_CASE("Reply previews", "[message][reply]") {
    ChatMessage target = sample_message();
    target.content = "short";
    auto preview = message::make_reply_preview(target);
    CHECK(preview.id == target.id);
    CHECK(preview.sender == "alice");
    CHECK(preview.content == "short");

    target.content = std::string(50, 'a');
    CHECK(message::make_reply_preview(target).content == std::string(50, 'a'));

    target.content = std::string(51, 'a');
    CHECK(message::make_reply_preview(target).content == std::string(50, 'a') + "...");

    // Truncation counts UTF-16 code units: one per BMP character...
    target.content = "";
    for (int i = 0; i < 60; i++)
        target.content += "\xc3\xa9";
    auto cut = message::make_reply_preview(target).content;
    CHECK(utf16_length(cut) == 53);
    CHECK(is_utf8(cut));
    CHECK(ends_with(cut, "\xc3\xa9..."));

    CHECK(message::make_reply_preview(target, 3).content == "\xc3\xa9\xc3\xa9\xc3\xa9...");

    // ...and two per character outside it
    const std::string grin = "\xf0\x9f\x98\x80";
    target.content = "";
    for (int i = 0; i < 30; i++)
        target.content += grin;
    CHECK(utf16_length(target.content) == 60);
    std::string expected;
    for (int i = 0; i < 25; i++)
        expected += grin;
    CHECK(message::make_reply_preview(target).content == expected + "...");

    // 25 emoji are exactly 50 units: nothing is cut
    target.content = expected;
    CHECK(message::make_reply_preview(target).content == expected);

    // A surrogate pair straddling the limit is left out, never split
    target.content = "a" + expected;
    auto straddled = message::make_reply_preview(target).content;
    CHECK(straddled == "a" + expected.substr(0, 24 * grin.size()) + "...");
    CHECK(is_utf8(straddled));
}

TEST_CASE("Legacy reply prefix", "[message][reply][legacy]") {
    ReplyPreview reply{"", "bob", "original text"};
    auto composed = message::compose_legacy_reply(reply, "my answer");
    CHECK(composed == "\xe2\x86\xa9\xef\xb8\x8f bob: \"original text\"\n\nmy answer");

    auto parsed = message::parse_legacy_reply(composed);
    REQUIRE(parsed);
    CHECK(parsed->first.sender == "bob");
    CHECK(parsed->first.content == "original text");
    CHECK(parsed->first.id.empty());
    CHECK(parsed->second == "my answer");

    // Multi-line body is kept whole
    parsed = message::parse_legacy_reply(message::compose_legacy_reply(reply, "one\n\ntwo"));
    REQUIRE(parsed);
    CHECK(parsed->second == "one\n\ntwo");

    CHECK_FALSE(message::parse_legacy_reply("just a message"));
    CHECK_FALSE(message::parse_legacy_reply("\xe2\x86\xa9\xef\xb8\x8f no quote here"));
    CHECK_FALSE(message::parse_legacy_reply("\xe2\x86\xa9\xef\xb8\x8f bob: \"unterminated"));
}

#include <rapidcheck.h>

#include <algorithm>
#include <catch2/catch_test_macros.hpp>

#include "rapidcheck/catch.h"
#include "roomchat/reactions.hpp"
#include "roomchat/transcript.hpp"
#include "utils.hpp"

using namespace roomchat;

namespace {

ChatMessage make_message(std::string id, uint64_t timestamp, std::string sender = "bob") {
    ChatMessage m;
    m.id = std::move(id);
    m.sender = std::move(sender);
    m.content = "message " + m.id;
    m.timestamp = timestamp;
    return m;
}

std::vector<std::string> ids(const Transcript& t) {
    std::vector<std::string> result;
    for (auto& e : t.entries())
        result.push_back(e.message.id);
    return result;
}

}  // namespace

TEST_CASE("Transcript deduplication", "[transcript][dedup]") {
    Transcript t;
    CHECK(t.add_incoming(make_message("a", 10)));
    CHECK_FALSE(t.add_incoming(make_message("a", 10)));
    CHECK_FALSE(t.add_incoming(make_message("a", 10)));
    CHECK(t.size() == 1);
    CHECK(t.seen_count() == 1);

    // Same id with different content is still a duplicate
    auto altered = make_message("a", 99, "mallory");
    CHECK_FALSE(t.add_incoming(altered));
    REQUIRE(t.find("a"));
    CHECK(t.find("a")->message.sender == "bob");

    CHECK(t.mark_seen("b"));
    CHECK_FALSE(t.mark_seen("b"));
    CHECK(t.seen("b"));
    CHECK_FALSE(t.add_incoming(make_message("b", 5)));
    CHECK(t.size() == 1);
    CHECK(t.seen_count() == 2);
}

TEST_CASE("Transcript deduplication properties", "[transcript][dedup]") {
    rc::prop("each id is delivered exactly once", [](const std::vector<uint8_t>& deliveries) {
        Transcript t;
        std::set<std::string> distinct;
        size_t accepted = 0;
        for (auto n : deliveries) {
            auto id = "m" + std::to_string(n % 16);
            distinct.insert(id);
            if (t.add_incoming(make_message(id, n)))
                accepted++;
        }
        RC_ASSERT(accepted == distinct.size());
        RC_ASSERT(t.size() == distinct.size());
        RC_ASSERT(t.seen_count() == distinct.size());
    });
}

TEST_CASE("Transcript ordering", "[transcript][ordering]") {
    Transcript t;
    t.add_incoming(make_message("c", 300));
    t.add_incoming(make_message("a", 100));
    t.add_incoming(make_message("b", 200));
    CHECK(ids(t) == std::vector<std::string>{"a", "b", "c"});

    // Equal timestamps keep arrival order
    t.add_incoming(make_message("b2", 200));
    t.add_incoming(make_message("b1", 200));
    CHECK(ids(t) == std::vector<std::string>{"a", "b", "b2", "b1", "c"});

    t.add_incoming(make_message("z", 0));
    CHECK(ids(t).front() == "z");

    auto msgs = t.messages();
    REQUIRE(msgs.size() == 6);
    CHECK(msgs[1].id == "a");

    rc::prop("entries stay sorted by timestamp", [](const std::vector<uint16_t>& stamps) {
        Transcript t;
        for (size_t i = 0; i < stamps.size(); i++)
            t.add_incoming(make_message("m" + std::to_string(i), stamps[i]));
        auto& entries = t.entries();
        RC_ASSERT(entries.size() == stamps.size());
        RC_ASSERT(std::is_sorted(
                entries.begin(), entries.end(), [](const auto& a, const auto& b) {
                    return a.message.timestamp < b.message.timestamp;
                }));
    });
}

TEST_CASE("Transcript outgoing messages", "[transcript][outgoing]") {
    Transcript t;
    t.add_outgoing(make_message("mine", 50, "alice"));
    REQUIRE(t.find("mine"));
    CHECK(t.find("mine")->outgoing);
    CHECK(t.find("mine")->status == SendStatus::pending);

    // The relay echo of our own message is suppressed
    CHECK_FALSE(t.add_incoming(make_message("mine", 50, "alice")));
    CHECK(t.size() == 1);

    CHECK_THROWS_AS(t.add_outgoing(make_message("mine", 60, "alice")), std::invalid_argument);

    CHECK(t.set_status("mine", SendStatus::sent));
    CHECK(t.find("mine")->status == SendStatus::sent);
    CHECK_FALSE(t.set_status("nope", SendStatus::sent));

    t.add_incoming(make_message("theirs", 40));
    CHECK_FALSE(t.find("theirs")->outgoing);
    CHECK(t.find("theirs")->status == SendStatus::received);

    t.add_outgoing(make_message("p1", 70, "alice"));
    t.add_outgoing(make_message("p2", 80, "alice"));
    t.set_status("p2", SendStatus::sent);
    CHECK(t.fail_pending() == std::vector<std::string>{"p1"});
    CHECK(t.find("p1")->status == SendStatus::failed);
    CHECK(t.find("p2")->status == SendStatus::sent);
    CHECK(t.find("theirs")->status == SendStatus::received);
    CHECK(t.fail_pending().empty());

    CHECK(send_status_name(SendStatus::pending) == "pending");
    CHECK(send_status_name(SendStatus::failed) == "failed");
}

TEST_CASE("Reactions", "[reactions]") {
    const std::string thumbs{REACTION_EMOJI[0]};
    const std::string heart{REACTION_EMOJI[1]};
    const std::string fire{REACTION_EMOJI[5]};

    CHECK(is_reaction_emoji("\xf0\x9f\x91\x8d"));
    CHECK(is_reaction_emoji("\xe2\x9d\xa4\xef\xb8\x8f"));
    CHECK_FALSE(is_reaction_emoji("\xe2\x9d\xa4"));  // heart without the emoji selector
    CHECK_FALSE(is_reaction_emoji("+1"));

    Reactions r;
    CHECK(r.get("m1").empty());

    CHECK(r.toggle("m1", fire, "alice"));
    CHECK(r.toggle("m1", thumbs, "alice"));
    CHECK(r.toggle("m1", thumbs, "bob"));
    CHECK(r.has_reacted("m1", thumbs, "bob"));
    CHECK_FALSE(r.has_reacted("m1", heart, "bob"));
    CHECK_FALSE(r.has_reacted("m2", thumbs, "bob"));

    // Palette order, users in reaction order
    CHECK(r.get("m1") ==
          std::vector<Reaction>{{thumbs, {"alice", "bob"}}, {fire, {"alice"}}});

    CHECK_FALSE(r.toggle("m1", thumbs, "alice"));
    CHECK(r.get("m1") == std::vector<Reaction>{{thumbs, {"bob"}}, {fire, {"alice"}}});

    CHECK_FALSE(r.toggle("m1", fire, "alice"));
    CHECK_FALSE(r.toggle("m1", thumbs, "bob"));
    CHECK(r.get("m1").empty());

    CHECK_THROWS_AS(r.toggle("m1", "+1", "alice"), std::invalid_argument);
}

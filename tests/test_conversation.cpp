#include <doctest/doctest.h>
#include "akka/conversation.hpp"

using namespace akka;

static ChatReply reply(const std::string& text, const std::string& intent) {
    ChatReply r;
    r.response = text;
    r.intent = intent;
    return r;
}

TEST_CASE("Fresh conversation defaults") {
    Conversation c{1};
    CHECK(c.table_id() == "T01");
    CHECK_FALSE(c.has_game());
    CHECK(c.history().empty());
    CHECK(c.session_id().version() == 4);
}

TEST_CASE("reset gives a new session id and empties history") {
    Conversation c{2};
    c.reset("catan");
    const Uuid first = c.session_id();
    c.commit_turn("q", reply("a", "rule_query"));
    REQUIRE(c.history().size() == 2);

    c.reset("catan");
    CHECK(c.session_id() != first);
    CHECK(c.history().empty());
    CHECK(c.game_name() == "catan");

    c.clear();
    CHECK_FALSE(c.has_game());
}

TEST_CASE("Request carries table, session, game and the new line last") {
    Conversation c{3};
    c.set_table_id("T09");
    c.reset("carcassonne");

    ChatRequest req = c.build_request("can I place a farmer here?");
    CHECK(req.table_id == "T09");
    CHECK(req.session_id == std::string(c.session_id().to_string().c_str()));
    CHECK(req.game_name == "carcassonne");
    CHECK(req.user_input == "can I place a farmer here?");
    REQUIRE(req.history.size() == 1);
    CHECK(req.history[0].role == ChatRole::User);
    CHECK(req.history[0].content == "can I place a farmer here?");
    CHECK_FALSE(req.history[0].intent);

    // building a request does not commit anything
    CHECK(c.history().empty());
}

TEST_CASE("commit_turn appends user then assistant with intent") {
    Conversation c{4};
    c.reset("catan");
    c.commit_turn("how do I win", reply("First to 10 points.", "rule_query"));
    c.commit_turn("thanks", reply("You're welcome.", ""));

    const auto& h = c.history();
    REQUIRE(h.size() == 4);
    CHECK(h[0].role == ChatRole::User);
    CHECK(h[1].role == ChatRole::Assistant);
    CHECK(h[1].content == "First to 10 points.");
    REQUIRE(h[1].intent);
    CHECK(*h[1].intent == "rule_query");
    CHECK_FALSE(h[3].intent);
}

TEST_CASE("Only the last ten history entries are sent") {
    Conversation c{5};
    c.reset("catan");
    for (int i = 0; i < 8; ++i) c.commit_turn("q" + std::to_string(i), reply("a" + std::to_string(i), "x"));
    REQUIRE(c.history().size() == 16);

    ChatRequest req = c.build_request("latest");
    REQUIRE(req.history.size() == 11);
    CHECK(req.history.front().content == "q3");
    CHECK(req.history[9].content == "a7");
    CHECK(req.history.back().content == "latest");
}

TEST_CASE("Table id is trimmed; blank ids are refused") {
    Conversation c{6};
    CHECK(c.set_table_id("\t T12 \n"));
    CHECK(c.table_id() == "T12");
    CHECK_FALSE(c.set_table_id(""));
    CHECK_FALSE(c.set_table_id("   "));
    CHECK(c.table_id() == "T12");
}

TEST_CASE("trim_copy") {
    CHECK(trim_copy("  a b  ") == "a b");
    CHECK(trim_copy("\r\n") == "");
    CHECK(trim_copy("") == "");
    CHECK(trim_copy("x") == "x");
}

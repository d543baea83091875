#include <doctest/doctest.h>
#include "nlohmann/json.hpp"
#include "akka/parser.hpp"

using namespace akka;
using json = nlohmann::json;

TEST_CASE("Chat request body matches the server schema") {
    ChatRequest req;
    req.table_id = "T01";
    req.session_id = "4b0c6f1e-7d3a-4c2b-9e8f-0a1b2c3d4e5f";
    req.game_name = "catan";
    req.user_input = "強盜怎麼移動？";

    ChatHistoryEntry u;
    u.role = ChatRole::User;
    u.content = "how many players";
    ChatHistoryEntry a;
    a.role = ChatRole::Assistant;
    a.content = "3 to 4";
    a.intent = "rule_query";
    req.history = {u, a};

    json j = json::parse(parser::to_json(req));
    CHECK(j["table_id"] == "T01");
    CHECK(j["session_id"] == req.session_id);
    CHECK(j["game_context"]["game_name"] == "catan");
    CHECK(j["user_input"] == "強盜怎麼移動？");
    REQUIRE(j["history"].size() == 2);
    CHECK(j["history"][0]["role"] == "user");
    CHECK(j["history"][0]["intent"] == "");
    CHECK(j["history"][1]["role"] == "assistant");
    CHECK(j["history"][1]["intent"] == "rule_query");
}

TEST_CASE("Invalid UTF-8 in a transcript does not break the request") {
    ChatRequest req;
    req.user_input = std::string("abc\xff\xfe", 5);
    std::string body = parser::to_json(req);
    CHECK_NOTHROW(json::parse(body));
}

TEST_CASE("Chat reply with optional fields") {
    std::string err;
    auto r = parser::chat_reply_from_json(
        R"({"response":"可以。","intent":"rule_query","source":"rules","latency_ms":812.5,"confidence":0.91})", err);
    REQUIRE(r);
    CHECK(r->response == "可以。");
    CHECK(r->intent == "rule_query");
    CHECK(r->source == "rules");
    REQUIRE(r->latency_ms);
    CHECK(*r->latency_ms == doctest::Approx(812.5));
    REQUIRE(r->confidence);
    CHECK(*r->confidence == doctest::Approx(0.91));
}

TEST_CASE("Chat reply with only a response") {
    std::string err;
    auto r = parser::chat_reply_from_json(R"({"response":"ok"})", err);
    REQUIRE(r);
    CHECK(r->intent.empty());
    CHECK_FALSE(r->latency_ms);
}

TEST_CASE("Malformed chat replies") {
    std::string err;
    CHECK_FALSE(parser::chat_reply_from_json(R"({"intent":"x"})", err));
    CHECK(err == "missing_response");
    CHECK_FALSE(parser::chat_reply_from_json(R"({"response":42})", err));
    CHECK(err == "missing_response");
    CHECK_FALSE(parser::chat_reply_from_json(R"({"response":"a","intent":7})", err));
    CHECK(err == "bad_field_type");
    CHECK_FALSE(parser::chat_reply_from_json("<html>502</html>", err));
    CHECK(err == "bad_json");
    CHECK_FALSE(parser::chat_reply_from_json("[]", err));
    CHECK(err == "not_object");
}

TEST_CASE("Game list") {
    std::string err;
    auto games = parser::games_from_json(R"({"games":[
        {"id":"catan","name":"卡坦島","description":"trade and build","enable_stt_injection":true},
        {"id":"chess","name":"Chess"}
    ]})", err);
    REQUIRE(games);
    REQUIRE(games->size() == 2);
    CHECK((*games)[0].id == "catan");
    CHECK((*games)[0].name == "卡坦島");
    CHECK((*games)[0].enable_stt_injection);
    CHECK((*games)[1].description.empty());
    CHECK_FALSE((*games)[1].enable_stt_injection);
}

TEST_CASE("Game entries need id and name") {
    std::string err;
    CHECK_FALSE(parser::games_from_json(R"({"games":[{"name":"no id"}]})", err));
    CHECK(err == "bad_json");
    CHECK_FALSE(parser::games_from_json(R"({"items":[]})", err));
    CHECK(err == "missing_games");
    CHECK_FALSE(parser::games_from_json(R"({"games":["catan"]})", err));
    CHECK(err == "bad_game_entry");
}

TEST_CASE("Keyword set") {
    std::string err;
    auto k = parser::keywords_from_json(R"({"id":"catan","correction_enabled":true,"keywords":["羊毛","磚塊",3,"強盜"]})",
                                        "catan", err);
    REQUIRE(k);
    CHECK(k->game_id == "catan");
    CHECK(k->correction_enabled);
    REQUIRE(k->keywords.size() == 3);
    CHECK(k->keywords[2] == "強盜");
}

TEST_CASE("Keyword set without id takes the requested game") {
    std::string err;
    auto k = parser::keywords_from_json(R"({"keywords":[]})", "chess", err);
    REQUIRE(k);
    CHECK(k->game_id == "chess");
    CHECK_FALSE(k->correction_enabled);
    CHECK(k->keywords.empty());

    CHECK_FALSE(parser::keywords_from_json(R"({"id":"chess"})", "chess", err));
    CHECK(err == "missing_keywords");
}

TEST_CASE("Server error bodies") {
    CHECK(parser::error_message_from_json(R"({"error_code":"GAME_NOT_FOUND","message":"no such game"})")
          == "GAME_NOT_FOUND: no such game");
    CHECK(parser::error_message_from_json(R"({"message":"overloaded"})") == "overloaded");
    CHECK(parser::error_message_from_json(R"({"error_code":"E42"})") == "E42");
    CHECK(parser::error_message_from_json("Internal Server Error") == "");
    CHECK(parser::error_message_from_json(R"({"detail":"x"})") == "");
}

#include <doctest/doctest.h>
#include "escrle/report.hpp"
#include "escrle/codec.hpp"

#include "nlohmann/json.hpp"

using json = nlohmann::json;
using namespace escrle;

TEST_CASE("result_json carries input, output and sizes") {
    json j = json::parse(report::result_json("encode", "escaped", "AAAA", "##00A4"));
    CHECK(j["op"] == "encode");
    CHECK(j["scheme"] == "escaped");
    CHECK(j["input"] == "AAAA");
    CHECK(j["output"] == "##00A4");
    CHECK(j["in_bytes"] == 4);
    CHECK(j["out_bytes"] == 6);
    CHECK_FALSE(j.contains("tokens"));
}

TEST_CASE("result_json embeds tokens when given") {
    std::vector<Token> toks;
    Fault f;
    REQUIRE(tokenize("##00B#1#2", toks, f));

    json j = json::parse(report::result_json("decode", "escaped", "##00B#1#2", "B12", &toks));
    REQUIRE(j["tokens"].is_array());
    REQUIRE(j["tokens"].size() == 3);
    CHECK(j["tokens"][1]["literal"] == "1");
    CHECK(j["tokens"][1]["text"] == "#1");
    CHECK(j["tokens"][1]["escaped"] == true);
    CHECK(j["tokens"][1]["offset"] == 5);
}

TEST_CASE("fault_json names the error") {
    std::string out;
    Fault f;
    REQUIRE_FALSE(decode("##00#x", out, f));

    json j = json::parse(report::fault_json("decode", "escaped", "##00#x", f));
    CHECK(j["error"]["code"] == "invalid_escape");
    CHECK(j["error"]["offset"] == 4);
    CHECK(j["error"]["message"].get<std::string>().size() > 0);
}

TEST_CASE("fault_json tolerates input that is not UTF-8") {
    std::string out;
    Fault f;
    const std::string bad = "ab\xFF";
    REQUIRE_FALSE(encode(bad, out, f));

    std::string text;
    CHECK_NOTHROW(text = report::fault_json("encode", "escaped", bad, f));
    json j = json::parse(text);
    CHECK(j["error"]["code"] == "invalid_input_type");
}

TEST_CASE("tokens_json is an array of token objects") {
    std::vector<Token> toks;
    Fault f;
    REQUIRE(tokenize("##00A4", toks, f));
    json j = json::parse(report::tokens_json(toks));
    REQUIRE(j.size() == 1);
    CHECK(j[0]["count"] == 4);
    CHECK(j[0]["escaped"] == false);
}

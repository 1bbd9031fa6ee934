#include <doctest/doctest.h>
#include "escrle/plain.hpp"

#include <string>

using namespace escrle;

TEST_CASE("plain::encode compresses letter runs") {
    std::string out;
    Fault f;
    REQUIRE(plain::encode("AAABCC", out, f));
    CHECK(out == "A3BC2");
    REQUIRE(plain::encode("abc", out, f));
    CHECK(out == "abc");
    REQUIRE(plain::encode("AaaBBB", out, f));
    CHECK(out == "A2aB3");
    REQUIRE(plain::encode(std::string(12, 'x') + "Y", out, f));
    CHECK(out == "x12Y");
}

TEST_CASE("plain::encode accepts letters only") {
    std::string out;
    Fault f;
    CHECK_FALSE(plain::encode("", out, f));
    CHECK(f.code == Error::EmptyInput);

    CHECK_FALSE(plain::encode("AB1", out, f));
    CHECK(f.code == Error::NonAlphabetic);
    CHECK(f.offset == 2);
    CHECK(out.empty());

    CHECK_FALSE(plain::encode("A B", out, f));
    CHECK(f.code == Error::NonAlphabetic);
}

TEST_CASE("plain::decode expands runs") {
    std::string out;
    Fault f;
    REQUIRE(plain::decode("A3BC2", out, f));
    CHECK(out == "AAABCC");
    REQUIRE(plain::decode("Z", out, f));
    CHECK(out == "Z");
    REQUIRE(plain::decode("a10B2", out, f));
    CHECK(out == "aaaaaaaaaaBB");
    REQUIRE(plain::decode("x12Y", out, f));
    CHECK(out == std::string(12, 'x') + "Y");
}

TEST_CASE("plain::decode rejects malformed input") {
    std::string out;
    Fault f;

    CHECK_FALSE(plain::decode("", out, f));
    CHECK(f.code == Error::EmptyInput);

    CHECK_FALSE(plain::decode("3A", out, f));
    CHECK(f.code == Error::InvalidLiteral);
    CHECK(f.offset == 0);

    CHECK_FALSE(plain::decode("A0", out, f));
    CHECK(f.code == Error::MalformedCount);
    CHECK(f.offset == 1);

    CHECK_FALSE(plain::decode("A01", out, f));
    CHECK(f.code == Error::MalformedCount);

    CHECK_FALSE(plain::decode("A-2", out, f));
    CHECK(f.code == Error::InvalidLiteral);
    CHECK(f.offset == 1);

    CHECK_FALSE(plain::decode("A 2", out, f));
    CHECK(f.code == Error::InvalidLiteral);

    CHECK_FALSE(plain::decode("AB3C0", out, f));
    CHECK(f.code == Error::MalformedCount);
    CHECK(f.offset == 4);
}

TEST_CASE("plain::decode honours the output limit") {
    Limits limits;
    limits.max_output = 5;
    std::string out;
    Fault f;
    REQUIRE(plain::decode("A5", out, f, limits));
    CHECK_FALSE(plain::decode("A3B3", out, f, limits));
    CHECK(f.code == Error::CountOverflow);
    CHECK(f.offset == 2);
}

TEST_CASE("plain::looks_encoded sniffs for digits") {
    CHECK(plain::looks_encoded("A3"));
    CHECK(plain::looks_encoded("x12Y"));
    CHECK_FALSE(plain::looks_encoded("ABC"));
    CHECK_FALSE(plain::looks_encoded(""));
}

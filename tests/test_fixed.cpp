#include <doctest/doctest.h>
#include "escrle/fixed.hpp"
#include "escrle/codec.hpp"

#include <cstring>
#include <string>

using namespace escrle;

static std::string str(const etl::istring& s) { return std::string(s.data(), s.size()); }

TEST_CASE("encode_fixed matches the std::string encoder") {
    etl::string<32> wire;
    Fault f;
    for (const char* text : {"AAAB", "B12", "###", "##00", "h\xC3\xA9\xC3\xA9"}) {
        std::string expect;
        Fault ef;
        REQUIRE(encode(text, expect, ef));

        REQUIRE(encode_fixed(text, std::strlen(text), wire, f));
        CHECK(str(wire) == expect);
    }
}

TEST_CASE("decode_fixed round-trips through a fixed buffer") {
    etl::string<32> wire;
    etl::string<32> back;
    Fault f;
    const char* text = "Z0##A 555";
    REQUIRE(encode_fixed(text, std::strlen(text), wire, f));
    REQUIRE(decode_fixed(wire.data(), wire.size(), back, f));
    CHECK(str(back) == text);
}

TEST_CASE("encode_fixed reports overflow and keeps the prefix that fit") {
    etl::string<5> wire;
    Fault f;
    CHECK_FALSE(encode_fixed("AB", 2, wire, f));
    CHECK(f.code == Error::OutputOverflow);
    CHECK(f.offset == 1);
    CHECK(str(wire) == "##00A");

    etl::string<3> tiny;
    CHECK_FALSE(encode_fixed("A", 1, tiny, f));
    CHECK(f.code == Error::OutputOverflow);
    CHECK(tiny.empty());
}

TEST_CASE("decode_fixed fills to capacity exactly or fails the whole run") {
    etl::string<10> exact;
    Fault f;
    REQUIRE(decode_fixed("##00a10", 7, exact, f));
    CHECK(str(exact) == std::string(10, 'a'));

    etl::string<8> small;
    CHECK_FALSE(decode_fixed("##00a10", 7, small, f));
    CHECK(f.code == Error::OutputOverflow);
    CHECK(f.offset == 4);
    CHECK(small.empty());
}

TEST_CASE("fixed entry points share the codec's validation") {
    etl::string<16> out;
    Fault f;

    CHECK_FALSE(encode_fixed("", 0, out, f));
    CHECK(f.code == Error::EmptyInput);

    CHECK_FALSE(decode_fixed("A4", 2, out, f));
    CHECK(f.code == Error::MissingHeader);

    CHECK_FALSE(decode_fixed("##00#x", 6, out, f));
    CHECK(f.code == Error::InvalidEscape);

    CHECK_FALSE(decode_fixed("##00A01", 7, out, f));
    CHECK(f.code == Error::MalformedCount);

    CHECK_FALSE(decode_fixed("##00", 4, out, f));
    CHECK(f.code == Error::EmptyBody);
}

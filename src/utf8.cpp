// -----------------------------------------------------------------------------
// @file utf8.cpp
// @brief Strict UTF-8 sequence scanning (RFC 3629, table 3-7 of Unicode).
// -----------------------------------------------------------------------------
#include "escrle/utf8.hpp"

namespace escrle {
namespace utf8 {

size_t sequence_length(const char* data, size_t len, size_t pos) {
    if (pos >= len) return 0;

    const unsigned char b0 = static_cast<unsigned char>(data[pos]);
    if (b0 < 0x80) return 1;

    // Lead byte decides the length and the allowed range of the second byte.
    size_t n = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if      (b0 >= 0xC2 && b0 <= 0xDF) { n = 2; }
    else if (b0 == 0xE0)               { n = 3; lo = 0xA0; }   // no overlongs
    else if (b0 >= 0xE1 && b0 <= 0xEC) { n = 3; }
    else if (b0 == 0xED)               { n = 3; hi = 0x9F; }   // no surrogates
    else if (b0 >= 0xEE && b0 <= 0xEF) { n = 3; }
    else if (b0 == 0xF0)               { n = 4; lo = 0x90; }   // no overlongs
    else if (b0 >= 0xF1 && b0 <= 0xF3) { n = 4; }
    else if (b0 == 0xF4)               { n = 4; hi = 0x8F; }   // <= U+10FFFF
    else return 0;

    if (len - pos < n) return 0;

    const unsigned char b1 = static_cast<unsigned char>(data[pos + 1]);
    if (b1 < lo || b1 > hi) return 0;

    for (size_t i = 2; i < n; ++i) {
        const unsigned char b = static_cast<unsigned char>(data[pos + i]);
        if (b < 0x80 || b > 0xBF) return 0;
    }
    return n;
}

bool is_valid(const char* data, size_t len, size_t* bad_offset) {
    size_t pos = 0;
    while (pos < len) {
        const size_t n = sequence_length(data, len, pos);
        if (n == 0) {
            if (bad_offset) *bad_offset = pos;
            return false;
        }
        pos += n;
    }
    return true;
}

size_t count_code_points(const char* data, size_t len) {
    size_t count = 0;
    for (size_t i = 0; i < len; ++i) {
        // Every byte that is not a continuation byte starts a code point.
        if ((static_cast<unsigned char>(data[i]) & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace utf8
} // namespace escrle

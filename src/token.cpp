// -----------------------------------------------------------------------------
// @file token.cpp
// @brief Run and token scanners for the escaped RLE format.
//
// Both scanners are flat loops over a (pointer, length) view and never
// allocate; tokenize() and to_text() are the only std::string conveniences.
// -----------------------------------------------------------------------------
#include "escrle/token.hpp"
#include "escrle/utf8.hpp"

#include <cstring>
#include <limits>

namespace escrle {

size_t render_literal(const char* cp, size_t n, char* out) {
    if (n == 1 && needs_escape(cp[0])) {
        out[0] = ESCAPE;
        out[1] = cp[0];
        return 2;
    }
    std::memcpy(out, cp, n);
    return n;
}

size_t render_count(uint64_t count, char* out) {
    // Digits come out least significant first; reverse in place afterwards.
    size_t n = 0;
    do {
        out[n++] = static_cast<char>('0' + (count % 10));
        count /= 10;
    } while (count != 0);

    for (size_t i = 0, j = n - 1; i < j; ++i, --j) {
        const char t = out[i];
        out[i] = out[j];
        out[j] = t;
    }
    return n;
}

bool next_run(const char* text, size_t len, size_t& pos, Run& run, Fault& fault) {
    const size_t n = utf8::sequence_length(text, len, pos);
    if (n == 0) return fail(fault, Error::InvalidInputType, pos);

    run.offset = pos;
    run.literal_len = static_cast<uint8_t>(n);
    std::memcpy(run.literal, text + pos, n);
    run.length = 1;
    pos += n;

    // Identical bytes are the identical (and already validated) code point.
    while (len - pos >= n && std::memcmp(text + pos, run.literal, n) == 0) {
        ++run.length;
        pos += n;
    }
    return true;
}

bool next_token(const char* stream, size_t len, size_t& pos, Token& tok, Fault& fault) {
    tok = Token{};
    tok.offset = pos;

    // --- literal ---
    const char c = stream[pos];
    if (c == ESCAPE) {
        if (pos + 1 >= len) return fail(fault, Error::DanglingEscape, pos);

        const char nxt = stream[pos + 1];
        if (nxt != ESCAPE && !is_digit(nxt)) return fail(fault, Error::InvalidEscape, pos);

        tok.literal[0] = nxt;
        tok.literal_len = 1;
        tok.escaped = true;
        pos += 2;
    } else if (is_digit(c)) {
        // Counts are consumed greedily after each literal, so a digit here has
        // no literal to belong to (only possible right after the header).
        return fail(fault, Error::MalformedCount, pos);
    } else {
        const size_t n = utf8::sequence_length(stream, len, pos);
        if (n == 0) return fail(fault, Error::InvalidInputType, pos);

        std::memcpy(tok.literal, stream + pos, n);
        tok.literal_len = static_cast<uint8_t>(n);
        pos += n;
    }

    // --- optional count ---
    if (pos < len && is_digit(stream[pos])) {
        if (stream[pos] == '0') return fail(fault, Error::MalformedCount, pos);

        const size_t start = pos;
        const uint64_t max = std::numeric_limits<uint64_t>::max();
        uint64_t count = 0;
        while (pos < len && is_digit(stream[pos])) {
            const uint64_t d = static_cast<uint64_t>(stream[pos] - '0');
            if (count > (max - d) / 10) return fail(fault, Error::CountOverflow, start);
            count = count * 10 + d;
            ++pos;
        }
        tok.count = count;
        tok.has_count = true;
    }

    tok.length = pos - tok.offset;
    return true;
}

bool tokenize(const std::string& stream, std::vector<Token>& out, Fault& fault) {
    out.clear();
    fault = Fault{};

    if (!has_header(stream)) return fail(fault, Error::MissingHeader, 0);
    if (stream.size() == HEADER_LEN) return fail(fault, Error::EmptyBody, HEADER_LEN);

    size_t pos = HEADER_LEN;
    Token tok;
    while (pos < stream.size()) {
        if (!next_token(stream.data(), stream.size(), pos, tok, fault)) return false;
        out.push_back(tok);
    }
    return true;
}

std::string to_text(const Token& tok) {
    char lit[MAX_LITERAL_TEXT];
    std::string s(lit, render_literal(tok.literal, tok.literal_len, lit));
    if (tok.has_count) {
        char digits[MAX_COUNT_DIGITS];
        s.append(digits, render_count(tok.count, digits));
    }
    return s;
}

} // namespace escrle

#pragma once

// Shared encode/decode loops, parameterized on the output sink so the
// std::string codec and the fixed-capacity ETL codec run the same code.
//
// A Sink provides:
//   size_t size() const;
//   bool   append(const char* p, size_t n, uint64_t times);   // false = no room

#include <cstddef>
#include <cstdint>

#include "escrle/error.hpp"
#include "escrle/format.hpp"
#include "escrle/token.hpp"

namespace escrle {
namespace detail {

template <typename Sink>
bool encode_into(const char* text, size_t len, Sink& sink, Fault& fault) {
    fault = Fault{};
    if (len == 0) return fail(fault, Error::EmptyInput, 0);

    if (!sink.append(HEADER, HEADER_LEN, 1)) return fail(fault, Error::OutputOverflow, 0);

    size_t pos = 0;
    Run run;
    char lit[MAX_LITERAL_TEXT];
    char digits[MAX_COUNT_DIGITS];

    while (pos < len) {
        if (!next_run(text, len, pos, run, fault)) return false;

        const size_t n = render_literal(run.literal, run.literal_len, lit);
        if (!sink.append(lit, n, 1)) return fail(fault, Error::OutputOverflow, run.offset);

        if (run.length > 1) {
            const size_t d = render_count(run.length, digits);
            if (!sink.append(digits, d, 1)) return fail(fault, Error::OutputOverflow, run.offset);
        }
    }
    return true;
}

template <typename Sink>
bool decode_into(const char* stream, size_t len, Sink& sink, Fault& fault, const Limits& limits) {
    fault = Fault{};
    if (!has_header(stream, len)) return fail(fault, Error::MissingHeader, 0);
    if (len == HEADER_LEN)        return fail(fault, Error::EmptyBody, HEADER_LEN);

    size_t pos = HEADER_LEN;
    Token tok;
    while (pos < len) {
        if (!next_token(stream, len, pos, tok, fault)) return false;

        // sink.size() never exceeds max_output, so the subtraction cannot wrap.
        const size_t room = limits.max_output - sink.size();
        if (tok.count > room / tok.literal_len) return fail(fault, Error::CountOverflow, tok.offset);

        if (!sink.append(tok.literal, tok.literal_len, tok.count)) {
            return fail(fault, Error::OutputOverflow, tok.offset);
        }
    }
    return true;
}

} // namespace detail
} // namespace escrle

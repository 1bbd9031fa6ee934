// -----------------------------------------------------------------------------
// @file plain.cpp
// @brief Letters-only RLE codec.
// -----------------------------------------------------------------------------
#include "escrle/plain.hpp"
#include "escrle/token.hpp"

#include <limits>

namespace escrle {
namespace plain {

bool encode(const std::string& text, std::string& out, Fault& fault) {
    out.clear();
    fault = Fault{};
    if (text.empty()) return fail(fault, Error::EmptyInput, 0);

    // Validate up front so a bad byte late in the input leaves no partial output.
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_letter(text[i])) return fail(fault, Error::NonAlphabetic, i);
    }

    char digits[MAX_COUNT_DIGITS];
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        size_t run = 1;
        while (i + run < text.size() && text[i + run] == c) ++run;

        out.push_back(c);
        if (run > 1) out.append(digits, render_count(run, digits));
        i += run;
    }
    return true;
}

bool decode(const std::string& rle, std::string& out, Fault& fault, const Limits& limits) {
    out.clear();
    fault = Fault{};
    if (rle.empty()) return fail(fault, Error::EmptyInput, 0);

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    size_t i = 0;
    while (i < rle.size()) {
        const size_t start = i;
        const char c = rle[i];
        if (!is_letter(c)) return fail(fault, Error::InvalidLiteral, i);
        ++i;

        uint64_t count = 1;
        if (i < rle.size() && is_digit(rle[i])) {
            if (rle[i] == '0') return fail(fault, Error::MalformedCount, i);
            count = 0;
            while (i < rle.size() && is_digit(rle[i])) {
                const uint64_t d = static_cast<uint64_t>(rle[i] - '0');
                if (count > (max - d) / 10) return fail(fault, Error::CountOverflow, start);
                count = count * 10 + d;
                ++i;
            }
        }

        if (count > limits.max_output - out.size()) return fail(fault, Error::CountOverflow, start);
        out.append(static_cast<size_t>(count), c);
    }
    return true;
}

bool looks_encoded(const std::string& text) {
    for (char c : text) {
        if (is_digit(c)) return true;
    }
    return false;
}

} // namespace plain
} // namespace escrle

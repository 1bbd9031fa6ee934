#pragma once

/**
 * @file format.hpp
 * @brief Wire-format constants for the escaped run-length text format.
 *
 * @details
 * OVERVIEW
 * --------
 * An encoded stream is a fixed 4-byte header followed by a body of tokens:
 *
 * @code
 *   Stream  := "##00" Body
 *   Body    := Token+
 *   Token   := Plain | Escaped
 *   Plain   := LETTER COUNT?
 *   Escaped := ("##" | "#" DIGIT) COUNT?
 *   COUNT   := [1-9][0-9]*
 * @endcode
 *
 * LETTER is any code point other than the escape byte and the ASCII digits.
 * A literal that would collide with the count grammar (a digit) or with the escape
 * introducer itself is written behind an ESCAPE byte, the same way SLIP hides its
 * END and ESC bytes inside a frame.
 *
 * ESCAPE RULES
 * ------------
 *   '#'         -> "##"
 *   digit d     -> "#d"
 *   anything    -> written as-is
 *
 * The count, when present, always follows the whole literal token, so the digit of
 * an escaped-digit token is never read as part of a count.
 *
 * EXAMPLES
 * --------
 * @code
 *   "AAAA"  -> "##00A4"
 *   "###"   -> "##00##3"
 *   "555"   -> "##00#53"
 *   "B12"   -> "##00B#1#2"
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace escrle {

/**
 * @name Stream sentinels
 * @{
 */

/// @brief Header that marks a string as encoded. Compared byte-for-byte.
static constexpr char HEADER[] = "##00";

/// @brief Length of @ref HEADER in bytes.
static constexpr size_t HEADER_LEN = 4;

/// @brief Escape introducer. Must be followed by another ESCAPE or an ASCII digit.
static constexpr char ESCAPE = '#';
/** @} */

/// @brief Widest decimal count a 64-bit run length can need.
static constexpr size_t MAX_COUNT_DIGITS = 20;

/// @brief Longest UTF-8 sequence for one code point.
static constexpr size_t MAX_LITERAL_BYTES = 4;

/// @brief Longest rendered literal: ESCAPE plus one digit, or a 4-byte code point.
static constexpr size_t MAX_LITERAL_TEXT = MAX_LITERAL_BYTES;

/// @brief Default cap on decoded output (64 MiB).
static constexpr size_t DEFAULT_MAX_OUTPUT = size_t(64) * 1024 * 1024;

/**
 * @brief Decoder resource limits.
 *
 * A count is only a handful of digits on the wire but can expand to an arbitrary
 * amount of output; @ref max_output bounds that expansion.
 */
struct Limits {
    size_t max_output = DEFAULT_MAX_OUTPUT;  ///< Maximum decoded size in bytes
};

/// @brief ASCII decimal digit test. Other Unicode digits are ordinary letters here.
inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

/// @brief True when the first bytes of @p data are exactly @ref HEADER.
inline bool has_header(const char* data, size_t len) {
    if (len < HEADER_LEN) return false;
    for (size_t i = 0; i < HEADER_LEN; ++i) {
        if (data[i] != HEADER[i]) return false;
    }
    return true;
}

inline bool has_header(const std::string& s) { return has_header(s.data(), s.size()); }

} // namespace escrle

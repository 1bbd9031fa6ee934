/**
 * @file token.hpp
 * @brief Run scanner (encode side) and token scanner (decode side).
 *
 * ---
 *
 * ## Runs and tokens
 *
 * The encoder walks plain text and groups it into **runs**: maximal repetitions of
 * one code point. Each run becomes exactly one **token** in the encoded body:
 *
 * | Run            | Token text | Notes                         |
 * |----------------|------------|-------------------------------|
 * | `A` x 1        | `A`        | count 1 is never written      |
 * | `A` x 4        | `A4`       |                               |
 * | `#` x 3        | `##3`      | escape byte is escaped        |
 * | `5` x 3        | `#53`      | digit literal is escaped      |
 * | `é` x 2        | `é2`       | literal is the whole code point |
 *
 * The decoder walks the body the other way, one token at a time, with a single
 * byte of lookahead after an escape.
 *
 * ---
 *
 * ## Memory
 *
 * `Run` and `Token` keep their literal in a fixed 4-byte array, and both scanners
 * work on `(const char*, size_t)` views, so scanning never touches the heap. That is
 * what lets the fixed-capacity API in fixed.hpp share this code with the
 * `std::string` codec.
 *
 * ---
 *
 * ## Usage
 *
 * ```cpp
 * std::vector<escrle::Token> toks;
 * escrle::Fault f;
 * if (escrle::tokenize("##00Z#0##2A", toks, f)) {
 *     for (const auto& t : toks) std::cout << escrle::to_text(t) << "\n";
 *     // Z, #0, ##2, A
 * }
 * ```
 */
#ifndef ESCRLE_TOKEN_HPP
#define ESCRLE_TOKEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "escrle/error.hpp"
#include "escrle/format.hpp"

namespace escrle {

/**
 * @struct Run
 * @brief A maximal repetition of one code point in plain text.
 */
struct Run {
    char     literal[MAX_LITERAL_BYTES] = {};  ///< UTF-8 bytes of the repeated code point
    uint8_t  literal_len = 0;                  ///< Bytes used in @ref literal (1..4)
    uint64_t length      = 0;                  ///< Number of repetitions (>= 1)
    size_t   offset      = 0;                  ///< Byte offset of the run in the text
};

/**
 * @struct Token
 * @brief One decoded body token: a literal code point and its repeat count.
 */
struct Token {
    char     literal[MAX_LITERAL_BYTES] = {};  ///< UTF-8 bytes of the literal code point
    uint8_t  literal_len = 0;                  ///< Bytes used in @ref literal (1..4)
    uint64_t count       = 1;                  ///< Repeat count; 1 when no count was written
    bool     escaped     = false;              ///< Written as "##" or "#d"
    bool     has_count   = false;              ///< A count followed the literal
    size_t   offset      = 0;                  ///< Byte offset of the token in the stream
    size_t   length      = 0;                  ///< Bytes the token occupies in the stream

    /// @brief Literal as a std::string (for display and tests).
    std::string literal_str() const { return std::string(literal, literal_len); }
};

/// @brief True when a one-byte literal must be written behind an escape.
inline bool needs_escape(char c) { return c == ESCAPE || is_digit(c); }

/**
 * @brief Write the token form of one literal code point (no count).
 * @param cp  UTF-8 bytes of the code point.
 * @param n   Number of bytes at @p cp (1..4).
 * @param out Buffer of at least @ref MAX_LITERAL_TEXT bytes.
 * @return Bytes written to @p out.
 */
size_t render_literal(const char* cp, size_t n, char* out);

/**
 * @brief Write @p count in decimal with no leading zeros.
 * @param out Buffer of at least @ref MAX_COUNT_DIGITS bytes.
 * @return Bytes written to @p out.
 */
size_t render_count(uint64_t count, char* out);

/**
 * @brief Scan the run that starts at @p pos in plain text.
 *
 * On success @p pos is advanced past the whole run. Fails with
 * Error::InvalidInputType when the bytes at @p pos are not a well-formed
 * UTF-8 sequence. Requires `pos < len`.
 */
bool next_run(const char* text, size_t len, size_t& pos, Run& run, Fault& fault);

/**
 * @brief Scan the token that starts at @p pos in an encoded body.
 *
 * @p pos is an offset into the full stream; it is advanced past the literal
 * and any count. Requires `pos < len`.
 *
 * Failures:
 * - Error::DanglingEscape   : escape is the last byte
 * - Error::InvalidEscape    : escape followed by neither '#' nor a digit
 * - Error::MalformedCount   : count starts with '0', or a digit where a literal belongs
 * - Error::CountOverflow    : count does not fit 64 bits
 * - Error::InvalidInputType : malformed UTF-8 literal
 */
bool next_token(const char* stream, size_t len, size_t& pos, Token& tok, Fault& fault);

/**
 * @brief Check the header and split the whole body into tokens.
 * @param out Cleared, then filled with every token in order.
 */
bool tokenize(const std::string& stream, std::vector<Token>& out, Fault& fault);

/// @brief Canonical text of a token: escaped literal followed by its count, if any.
std::string to_text(const Token& tok);

} // namespace escrle

#endif // ESCRLE_TOKEN_HPP

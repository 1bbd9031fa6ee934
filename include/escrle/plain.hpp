#pragma once

/**
 * @file plain.hpp
 * @brief Letters-only compressed RLE: the unescaped sibling format.
 *
 * @details
 * The older wire format carries no header and no escapes: each run is one ASCII
 * letter followed by an optional count (`"AAABCC"` <-> `"A3BC2"`). It can only
 * represent `[A-Za-z]+`, which is why the escaped format replaced it, but tools
 * that still exchange it can use these functions. Case is preserved.
 *
 * Count rules match the escaped format: positive, no leading zeros, omitted for 1.
 */

#include <string>

#include "escrle/error.hpp"
#include "escrle/format.hpp"

namespace escrle {
namespace plain {

/// @brief ASCII letter test.
inline bool is_letter(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

/**
 * @brief Encode letters as compressed RLE.
 * @param fault Error::EmptyInput or Error::NonAlphabetic (offset of the first non-letter).
 */
bool encode(const std::string& text, std::string& out, Fault& fault);

/**
 * @brief Decode compressed RLE.
 * @param fault Error::EmptyInput, Error::InvalidLiteral, Error::MalformedCount or
 *              Error::CountOverflow.
 */
bool decode(const std::string& rle, std::string& out, Fault& fault,
            const Limits& limits = Limits{});

/// @brief Heuristic used by line-oriented front ends: any digit means "decode me".
bool looks_encoded(const std::string& text);

} // namespace plain
} // namespace escrle

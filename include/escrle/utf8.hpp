/**
 * @file utf8.hpp
 * @brief Code-point boundary scanning over UTF-8 text.
 *
 * Runs and literals are whole code points, so the scanners step through text one
 * UTF-8 sequence at a time instead of one byte at a time. Validation is strict
 * (RFC 3629): overlong forms, surrogates and values above U+10FFFF are malformed.
 *
 * Nothing here allocates.
 */
#ifndef ESCRLE_UTF8_HPP
#define ESCRLE_UTF8_HPP

#include <cstddef>
#include <string>

namespace escrle {
namespace utf8 {

/**
 * @brief Length of the well-formed sequence starting at @p pos.
 * @return 1..4, or 0 if @p pos is past the end or the bytes there are malformed.
 */
size_t sequence_length(const char* data, size_t len, size_t pos);

/**
 * @brief Validate a whole buffer.
 * @param bad_offset If non-null, receives the offset of the first malformed byte.
 */
bool is_valid(const char* data, size_t len, size_t* bad_offset = nullptr);

inline bool is_valid(const std::string& s, size_t* bad_offset = nullptr) {
    return is_valid(s.data(), s.size(), bad_offset);
}

/// @brief Number of code points in already-validated text.
size_t count_code_points(const char* data, size_t len);

inline size_t count_code_points(const std::string& s) {
    return count_code_points(s.data(), s.size());
}

} // namespace utf8
} // namespace escrle

#endif // ESCRLE_UTF8_HPP

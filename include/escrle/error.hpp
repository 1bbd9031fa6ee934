/**
 * @file error.hpp
 * @brief Error kinds and fault records shared by every escrle codec.
 *
 * Codec functions never throw. Each fallible call returns `bool` and fills a
 * caller-owned @ref escrle::Fault with the error kind and the byte offset where the
 * scan stopped. Callers choose the presentation:
 *
 * - @ref escrle::error_name gives a short, stable, script-friendly identifier
 *   such as `"missing_header"` or `"malformed_count"`.
 * - @ref escrle::error_message gives a one-line human explanation.
 *
 * @code
 * std::string out;
 * escrle::Fault f;
 * if (!escrle::decode("##00#x", out, f)) {
 *     std::cerr << "status=error reason=" << escrle::error_name(f.code)
 *               << " offset=" << f.offset << "\n";
 * }
 * @endcode
 */
#ifndef ESCRLE_ERROR_HPP
#define ESCRLE_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace escrle {

/**
 * @enum Error
 * @brief Every way an encode or decode call can fail.
 */
enum class Error : uint8_t {
    /** No error. */
    None = 0,

    /** Input is not text: malformed UTF-8 sequence. */
    InvalidInputType,

    /** Encode called with an empty string (also an empty plain-RLE stream). */
    EmptyInput,

    /** Stream does not start with the exact "##00" header. */
    MissingHeader,

    /** Header present but no token follows it. */
    EmptyBody,

    /** Stream ends right after an escape byte. */
    DanglingEscape,

    /** Escape byte followed by something other than '#' or a digit. */
    InvalidEscape,

    /** Count with a leading zero, a zero count, or a count with no literal. */
    MalformedCount,

    /** Count does not fit 64 bits or the output would exceed the decode limit. */
    CountOverflow,

    /** Result does not fit a fixed-capacity output string. */
    OutputOverflow,

    /** Plain RLE encode input contains a non-letter. */
    NonAlphabetic,

    /** Plain RLE stream has a non-letter where a literal is expected. */
    InvalidLiteral
};

/**
 * @brief Outcome of a failed call: what went wrong and where.
 *
 * `offset` is a byte offset into the string that was being scanned (the full
 * stream for decode, including the header).
 */
struct Fault {
    Error  code   = Error::None;
    size_t offset = 0;

    bool ok() const { return code == Error::None; }
};

/**
 * @brief Stable snake_case identifier for an error kind.
 * @return Static string, e.g. "dangling_escape". Never nullptr.
 */
const char* error_name(Error e);

/**
 * @brief Human-readable one-line description of an error kind.
 * @return Static string. Never nullptr.
 */
const char* error_message(Error e);

/**
 * @brief Reverse lookup of @ref error_name.
 * @param name Identifier such as "invalid_escape".
 * @param out  Receives the matching kind on success.
 * @retval true  Name recognized.
 * @retval false Unknown name; @p out untouched.
 */
bool parse_error_name(const std::string& name, Error& out);

/// @brief Record @p code at @p offset into @p fault and return false.
inline bool fail(Fault& fault, Error code, size_t offset) {
    fault.code = code;
    fault.offset = offset;
    return false;
}

} // namespace escrle

#endif // ESCRLE_ERROR_HPP

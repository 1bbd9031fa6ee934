/**
 * @file fixed.hpp
 * @brief Heap-free encode/decode into fixed-capacity ETL strings.
 *
 * ---
 *
 * ## Embedded use
 *
 * Microcontroller builds avoid `std::string`: heap allocation, exceptions and
 * binary size are all problems on small targets. These entry points write into an
 * `etl::string<N>` (passed as its capacity-erased base `etl::istring`) and scan the
 * input through the same allocation-free run and token scanners as the desktop
 * codec, so behavior is identical apart from one extra failure:
 *
 * - Error::OutputOverflow when the result does not fit `out.capacity()`.
 *   The string then holds the prefix that did fit.
 *
 * **ETL**: https://www.etlcpp.com/
 *
 * ---
 *
 * ## Example
 *
 * ```cpp
 * etl::string<64> wire;
 * escrle::Fault f;
 * if (escrle::encode_fixed("AAAB", 4, wire, f)) {
 *     // wire == "##00A3B"
 * }
 * ```
 */
#ifndef ESCRLE_FIXED_HPP
#define ESCRLE_FIXED_HPP

#include "etl/string.h"
#include <stddef.h>

#include "escrle/error.hpp"

namespace escrle {

/**
 * @brief Encode @p len bytes of UTF-8 text into @p out.
 * @param out Cleared first; receives "##00" + tokens.
 */
bool encode_fixed(const char* text, size_t len, etl::istring& out, Fault& fault);

/**
 * @brief Decode @p len bytes of an encoded stream into @p out.
 * @param out Cleared first; receives the original text.
 */
bool decode_fixed(const char* stream, size_t len, etl::istring& out, Fault& fault);

} // namespace escrle

#endif // ESCRLE_FIXED_HPP

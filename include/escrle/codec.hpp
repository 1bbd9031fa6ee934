/**
 * @file codec.hpp
 * @brief Escaped run-length encoder and decoder for arbitrary UTF-8 text.
 *
 * @details
 * The codec is two pure functions:
 *   - @ref escrle::encode turns non-empty text into `"##00" + tokens`.
 *   - @ref escrle::decode validates such a stream and expands it back.
 *
 * `decode(encode(s)) == s` for every non-empty, valid UTF-8 string `s`.
 *
 * Neither function throws, logs or keeps state between calls; both are safe to call
 * concurrently on separate buffers. On failure the output string holds whatever was
 * produced before the error and should be discarded.
 *
 * A front end that reads one line and "does the right thing" uses
 * @ref escrle::classify or @ref escrle::transcode: input that starts with the header
 * is decoded, anything else is encoded.
 */
#ifndef ESCRLE_CODEC_HPP
#define ESCRLE_CODEC_HPP

#include <cstdint>
#include <string>

#include "escrle/error.hpp"
#include "escrle/format.hpp"

namespace escrle {

/// @brief Which way a line of input should be transformed.
enum class Direction : uint8_t {
    Encode,
    Decode
};

/// @brief "encode" or "decode".
const char* direction_name(Direction d);

/**
 * @brief Encode text as an escaped RLE stream.
 * @param text  Non-empty UTF-8 text.
 * @param out   Receives the stream (always starting with "##00").
 * @param fault On failure: Error::EmptyInput or Error::InvalidInputType.
 */
bool encode(const std::string& text, std::string& out, Fault& fault);

/**
 * @brief Decode an escaped RLE stream.
 * @param stream "##00" followed by at least one token.
 * @param out    Receives the original text.
 * @param fault  On failure: kind and byte offset into @p stream.
 * @param limits Cap on the decoded size.
 */
bool decode(const std::string& stream, std::string& out, Fault& fault,
            const Limits& limits = Limits{});

/// @brief Decode when @p input carries the header, encode otherwise.
Direction classify(const std::string& input);

/**
 * @brief Classify @p input and run the matching direction.
 * @param dir Receives the direction that was chosen, also on failure.
 */
bool transcode(const std::string& input, std::string& out, Direction& dir, Fault& fault,
               const Limits& limits = Limits{});

} // namespace escrle

#endif // ESCRLE_CODEC_HPP

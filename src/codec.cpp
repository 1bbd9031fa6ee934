// -----------------------------------------------------------------------------
// @file codec.cpp
// @brief std::string front end for the escaped RLE codec.
//
// The scanning loops live in detail/transcode.hpp; this file only supplies a
// growable std::string sink.
// -----------------------------------------------------------------------------
#include "escrle/codec.hpp"
#include "escrle/detail/transcode.hpp"

namespace escrle {

namespace {

struct StringSink {
    std::string& out;

    size_t size() const { return out.size(); }

    bool append(const char* p, size_t n, uint64_t times) {
        if (n == 1) {
            out.append(static_cast<size_t>(times), p[0]);
        } else {
            for (uint64_t i = 0; i < times; ++i) out.append(p, n);
        }
        return true;
    }
};

} // namespace

const char* direction_name(Direction d) {
    return d == Direction::Decode ? "decode" : "encode";
}

bool encode(const std::string& text, std::string& out, Fault& fault) {
    out.clear();
    // Worst case is every code point a digit: two output bytes per input byte.
    out.reserve(HEADER_LEN + text.size() * 2);
    StringSink sink{out};
    return detail::encode_into(text.data(), text.size(), sink, fault);
}

bool decode(const std::string& stream, std::string& out, Fault& fault, const Limits& limits) {
    out.clear();
    StringSink sink{out};
    return detail::decode_into(stream.data(), stream.size(), sink, fault, limits);
}

Direction classify(const std::string& input) {
    return has_header(input) ? Direction::Decode : Direction::Encode;
}

bool transcode(const std::string& input, std::string& out, Direction& dir, Fault& fault,
               const Limits& limits) {
    dir = classify(input);
    if (dir == Direction::Decode) return decode(input, out, fault, limits);
    return encode(input, out, fault);
}

} // namespace escrle

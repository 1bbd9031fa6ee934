/**
 * @file fixed.cpp
 * @brief ETL-backed sink for the heap-free codec entry points.
 *
 * The sink checks the remaining capacity before every append, so an
 * `etl::istring` never silently truncates (or trips ETL's own overflow
 * handling): the codec sees `false` and reports Error::OutputOverflow.
 */
#include "escrle/fixed.hpp"
#include "escrle/detail/transcode.hpp"

#include <limits>

namespace escrle {

namespace {

struct FixedSink {
    etl::istring& out;

    size_t size() const { return out.size(); }

    bool append(const char* p, size_t n, uint64_t times) {
        const size_t room = out.capacity() - out.size();
        if (times > room / n) return false;

        if (n == 1) {
            out.append(static_cast<size_t>(times), p[0]);
        } else {
            for (uint64_t i = 0; i < times; ++i) out.append(p, n);
        }
        return true;
    }
};

} // namespace

bool encode_fixed(const char* text, size_t len, etl::istring& out, Fault& fault) {
    out.clear();
    FixedSink sink{out};
    return detail::encode_into(text, len, sink, fault);
}

bool decode_fixed(const char* stream, size_t len, etl::istring& out, Fault& fault) {
    out.clear();
    FixedSink sink{out};

    // Capacity is the real limit here; let the sink report it as OutputOverflow.
    Limits limits;
    limits.max_output = std::numeric_limits<size_t>::max();
    return detail::decode_into(stream, len, sink, fault, limits);
}

} // namespace escrle

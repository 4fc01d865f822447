#include "bmt/chunk/span.hpp"

#include <string>
#include <utility>

namespace bmt::chunk {

Result<Bytes> make_span(std::int64_t value, std::size_t length) {
    if (value < 0) {
        return Err<Bytes>(ErrorCode::InvalidSpanValue,
                          "span value " + std::to_string(value) + " is negative");
    }
    if (value > kMaxSpanLength) {
        return Err<Bytes>(ErrorCode::InvalidSpanValue,
                          "span value " + std::to_string(value) + " does not fit in 32 bits");
    }
    if (length < 4) {
        return Err<Bytes>(ErrorCode::InvalidOptions,
                          "span length " + std::to_string(length) + " cannot hold a 32-bit value");
    }

    Bytes span(length, 0);
    const auto v = static_cast<std::uint32_t>(value);
    span[0] = static_cast<std::uint8_t>(v);
    span[1] = static_cast<std::uint8_t>(v >> 8);
    span[2] = static_cast<std::uint8_t>(v >> 16);
    span[3] = static_cast<std::uint8_t>(v >> 24);
    return Ok(std::move(span));
}

std::uint32_t get_span_value(ByteRange span) noexcept {
    std::uint32_t value = 0;
    const std::size_t n = span.size < 4 ? span.size : 4;
    for (std::size_t i = 0; i < n; ++i) {
        value |= static_cast<std::uint32_t>(span.data[i]) << (8 * i);
    }
    return value;
}

} // namespace bmt::chunk

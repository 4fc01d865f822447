#pragma once

#include "bmt/core/bytes.hpp"
#include "bmt/core/result.hpp"

#include <cstdint>

namespace bmt::chunk {

inline constexpr std::size_t kSpanSize = 8;

/// Spans are limited to 32 bits; the upper four span bytes are always zero.
inline constexpr std::int64_t kMaxSpanLength = 0xFFFFFFFFll;

/**
 * @brief Encode a span value
 *
 * Writes the low 32 bits of @p value little-endian into the first four bytes
 * of a @p length byte buffer; the rest stays zero.
 *
 * Fails with InvalidSpanValue when value < 0 or value > kMaxSpanLength, and
 * with InvalidOptions when length < 4.
 */
Result<Bytes> make_span(std::int64_t value, std::size_t length = kSpanSize);

/**
 * @brief Decode a span value from its first four bytes (little-endian)
 *
 * Bytes past the fourth are ignored; a shorter input reads as zero-extended.
 */
std::uint32_t get_span_value(ByteRange span) noexcept;

} // namespace bmt::chunk

#pragma once

#include "bmt/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace bmt {

inline constexpr std::size_t kSegmentSize = 32;

using Bytes = std::vector<std::uint8_t>;

/// One 32-byte unit of chunk data, also the width of every hash in the tree.
using Segment = std::array<std::uint8_t, kSegmentSize>;

/**
 * @brief Non-owning view over contiguous bytes
 *
 * The viewed storage must outlive the range.
 */
struct ByteRange {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;

    ByteRange() = default;
    ByteRange(const std::uint8_t* d, std::size_t n) : data(d), size(n) {}
    ByteRange(const Bytes& bytes) : data(bytes.data()), size(bytes.size()) {}
    ByteRange(const Segment& segment) : data(segment.data()), size(segment.size()) {}

    [[nodiscard]] bool empty() const noexcept { return size == 0; }

    /// Sub-range clamped to the viewed bytes.
    [[nodiscard]] ByteRange slice(std::size_t offset, std::size_t length) const noexcept;
};

/// Lower-case hex without a prefix.
std::string to_hex(ByteRange bytes);

/// Parses hex text with an optional "0x" prefix.
Result<Bytes> from_hex(std::string_view hex);

/// Parses hex text that must decode to exactly one segment.
Result<Segment> segment_from_hex(std::string_view hex);

bool bytes_equal(ByteRange lhs, ByteRange rhs) noexcept;

/// Concatenates the given ranges into one buffer.
Bytes concat_bytes(std::initializer_list<ByteRange> parts);

/// Segment @p segment_index of @p data, zero-padded when the data ends inside
/// (or before) it.
Segment segment_at(ByteRange data, std::size_t segment_index);

} // namespace bmt

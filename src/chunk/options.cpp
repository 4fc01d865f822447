#include "bmt/chunk/options.hpp"

#include <string>

namespace bmt::chunk {

Result<void> validate_options(const ChunkOptions& options) {
    if (!options.hash_fn) {
        return Err<void>(ErrorCode::InvalidOptions, "hash function is not set");
    }

    const std::size_t size = options.max_payload_size;
    if (size < kSegmentPairSize || (size & (size - 1)) != 0) {
        return Err<void>(ErrorCode::InvalidOptions,
                         "max payload size " + std::to_string(size) +
                             " is not a power of two of at least " + std::to_string(kSegmentPairSize));
    }

    if (options.span_length < 4) {
        return Err<void>(ErrorCode::InvalidOptions,
                         "span length " + std::to_string(options.span_length) + " is below 4 bytes");
    }

    return Ok();
}

std::size_t max_segment_count(std::size_t max_payload_size) noexcept {
    return max_payload_size / kSegmentSize;
}

std::size_t chunk_bmt_levels(std::size_t max_payload_size) noexcept {
    std::size_t levels = 0;
    for (std::size_t count = max_segment_count(max_payload_size); count > 1; count >>= 1) {
        ++levels;
    }
    return levels;
}

} // namespace bmt::chunk

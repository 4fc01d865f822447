#pragma once

#include "bmt/chunk/span.hpp"
#include "bmt/core/result.hpp"
#include "bmt/crypto/hash.hpp"

#include <cstdint>
#include <optional>

namespace bmt::chunk {

inline constexpr std::size_t kSegmentPairSize = 2 * kSegmentSize;
inline constexpr std::size_t kDefaultMaxPayloadSize = 4096;

/**
 * @brief Per-chunk configuration
 *
 * max_payload_size must be a power of two of at least one segment pair so
 * that repeated pair hashing ends in exactly one 32-byte root.
 */
struct ChunkOptions {
    crypto::HashFunction hash_fn = crypto::keccak256;
    std::size_t max_payload_size = kDefaultMaxPayloadSize;
    std::size_t span_length = kSpanSize;
    std::optional<std::int64_t> starting_span_value; ///< Defaults to the payload length
};

Result<void> validate_options(const ChunkOptions& options);

/// Branching factor of the file tree: 128 for 4096-byte chunks.
std::size_t max_segment_count(std::size_t max_payload_size) noexcept;

/// Depth of one chunk's BMT below its root: 7 for 4096-byte chunks.
std::size_t chunk_bmt_levels(std::size_t max_payload_size) noexcept;

} // namespace bmt::chunk

#pragma once

#include "bmt/chunk/options.hpp"
#include "bmt/core/result.hpp"

#include <cstddef>

namespace bmt::file {

/**
 * @brief Position of a chunk in the file tree
 */
struct BmtPosition {
    std::size_t chunk_index = 0; ///< Index of the parent chunk on its level
    std::size_t level = 0;       ///< Extra levels skipped because of a carrier chunk

    bool operator==(const BmtPosition& other) const noexcept {
        return chunk_index == other.chunk_index && level == other.level;
    }
};

/**
 * @brief Map a segment index to its parent chunk position
 *
 * Without carriers the parent is simply segment_index >> chunk_bmt_levels.
 * When the segment falls into the last chunk of its level and that chunk's
 * index is a non-zero multiple of max_segment_count, the chunk is a carrier
 * that was deferred upwards; the mapping then keeps climbing while the
 * shifted index stays a multiple of max_segment_count, counting one level per
 * step.
 *
 * @param segment_index   Segment index relative to the current level
 * @param last_chunk_index Index of the last chunk on the current level
 * @param max_chunk_payload_size Chunk payload capacity (4096 by default)
 *
 * Fails with InvalidOptions unless max_chunk_payload_size is a power of two
 * of at least 64 bytes.
 */
Result<BmtPosition> get_bmt_index_of_segment(std::size_t segment_index,
                                     std::size_t last_chunk_index,
                                     std::size_t max_chunk_payload_size = chunk::kDefaultMaxPayloadSize);

} // namespace bmt::file

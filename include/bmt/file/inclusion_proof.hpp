#pragma once

#include "bmt/chunk/options.hpp"
#include "bmt/core/bytes.hpp"
#include "bmt/core/result.hpp"
#include "bmt/file/tree_builder.hpp"

#include <cstddef>
#include <vector>

namespace bmt::file {

/**
 * @brief Proof data contributed by one chunk on the path to the file root
 */
struct ChunkInclusionProof {
    Bytes span;
    std::vector<Segment> sister_segments;

    bool operator==(const ChunkInclusionProof& other) const {
        return span == other.span && sister_segments == other.sister_segments;
    }
    bool operator!=(const ChunkInclusionProof& other) const { return !(*this == other); }
};

/**
 * @brief Collect the proof of segment @p segment_index of the file payload
 *
 * One entry per traversed chunk, leaf chunk first and root chunk last. A
 * segment inside a carrier chunk skips the levels the carrier was deferred
 * past, so the list can be shorter than the tree height.
 *
 * Fails with InvalidSegmentIndex when segment_index * 32 >= the file span.
 */
Result<std::vector<ChunkInclusionProof>> file_inclusion_proof_bottom_up(const ChunkedFile& file,
                                                                        std::size_t segment_index);

/**
 * @brief Recompute the file address from a proof
 *
 * @param proof_chunks  Output of file_inclusion_proof_bottom_up
 * @param prove_segment The 32-byte segment being proven (zero-padded)
 * @param prove_segment_index Index of that segment in the file payload
 * @param options Chunk configuration the file was built with
 *
 * The caller compares the result with the expected address. Structurally
 * inconsistent proofs fail with InvalidProof.
 */
Result<Segment> file_address_from_inclusion_proof(const std::vector<ChunkInclusionProof>& proof_chunks,
                                                  const Segment& prove_segment,
                                                  std::size_t prove_segment_index,
                                                  const chunk::ChunkOptions& options = {});

} // namespace bmt::file

#include "bmt/file/inclusion_proof.hpp"

#include "bmt/chunk/span.hpp"
#include "bmt/file/position.hpp"

#include <spdlog/spdlog.h>

#include <climits>
#include <string>
#include <utility>

namespace bmt::file {
namespace {

std::size_t shift_right(std::size_t value, std::size_t bits) {
    return bits >= sizeof(std::size_t) * CHAR_BIT ? 0 : value >> bits;
}

Result<Segment> reject(std::string message) {
    spdlog::warn("Rejected inclusion proof: {}", message);
    return Err<Segment>(ErrorCode::InvalidProof, std::move(message));
}

} // namespace

Result<std::vector<ChunkInclusionProof>> file_inclusion_proof_bottom_up(const ChunkedFile& file,
                                                                        std::size_t segment_index) {
    using ProofList = std::vector<ChunkInclusionProof>;

    const std::size_t file_span = file.span_value();
    if (segment_index >= (file_span + kSegmentSize - 1) / kSegmentSize) {
        return Err<ProofList>(ErrorCode::InvalidSegmentIndex,
                              "segment index " + std::to_string(segment_index) +
                                  " is out of range for a file of " + std::to_string(file_span) + " bytes");
    }

    const auto& levels = file.bmt();
    const auto& carriers = file.carriers();
    const std::size_t max_segments = file.builder().max_segment_count();
    const std::size_t bmt_levels = chunk::chunk_bmt_levels(file.builder().hasher().max_payload_size());

    ProofList proofs;
    std::size_t level = 0;
    while (true) {
        const std::size_t chunk_segment_index = segment_index % max_segments;
        std::size_t chunk_index = segment_index / max_segments;

        if (chunk_index == levels[level].size() && carriers[level]) {
            // The chunk is a carrier; find the level where it was merged.
            segment_index >>= bmt_levels;
            while (segment_index != 0 && segment_index % max_segments == 0) {
                ++level;
                segment_index >>= bmt_levels;
            }
            if (level >= levels.size()) {
                return Err<ProofList>(ErrorCode::InvalidSegmentIndex, "carrier chunk is not part of the tree");
            }
            chunk_index = levels[level].size() - 1;
            spdlog::debug("Segment is carried up to level {} as chunk {}", level, chunk_index);
        }

        if (chunk_index >= levels[level].size()) {
            return Err<ProofList>(ErrorCode::InvalidSegmentIndex,
                                  "chunk index " + std::to_string(chunk_index) + " is out of range on level " +
                                      std::to_string(level));
        }

        const chunk::Chunk& chunk = levels[level][chunk_index];
        auto sister_segments = chunk.inclusion_proof(chunk_segment_index);
        if (sister_segments.is_error()) {
            return Err<ProofList>(sister_segments.error());
        }
        proofs.push_back(ChunkInclusionProof{chunk.span(), std::move(sister_segments.value())});

        if (level + 1 == levels.size()) {
            break;
        }
        segment_index = chunk_index;
        ++level;
    }

    return Ok(std::move(proofs));
}

Result<Segment> file_address_from_inclusion_proof(const std::vector<ChunkInclusionProof>& proof_chunks,
                                                  const Segment& prove_segment,
                                                  std::size_t prove_segment_index,
                                                  const chunk::ChunkOptions& options) {
    if (auto valid = chunk::validate_options(options); valid.is_error()) {
        return Err<Segment>(valid.error());
    }
    if (proof_chunks.empty()) {
        return reject("proof contains no chunks");
    }

    const std::size_t max_payload = options.max_payload_size;
    const std::size_t bmt_levels = chunk::chunk_bmt_levels(max_payload);

    for (const auto& proof_chunk : proof_chunks) {
        if (proof_chunk.span.size() != options.span_length) {
            return reject("span of " + std::to_string(proof_chunk.span.size()) + " bytes, expected " +
                          std::to_string(options.span_length));
        }
        if (proof_chunk.sister_segments.size() != bmt_levels) {
            return reject(std::to_string(proof_chunk.sister_segments.size()) + " sister segments, expected " +
                          std::to_string(bmt_levels));
        }
    }

    const std::size_t file_size = chunk::get_span_value(proof_chunks.back().span);
    if (file_size == 0) {
        return reject("root span claims an empty file");
    }
    if (prove_segment_index >= (file_size + kSegmentSize - 1) / kSegmentSize) {
        return Err<Segment>(ErrorCode::InvalidSegmentIndex,
                            "segment index " + std::to_string(prove_segment_index) +
                                " is out of range for a file of " + std::to_string(file_size) + " bytes");
    }

    std::size_t last_chunk_index = (file_size - 1) / max_payload;
    std::size_t segment_index = prove_segment_index;
    Segment calculated = prove_segment;
    bool reached_root = false;

    for (const auto& proof_chunk : proof_chunks) {
        if (reached_root) {
            return reject("proof continues past the root chunk");
        }

        auto position = get_bmt_index_of_segment(segment_index, last_chunk_index, max_payload);
        if (position.is_error()) {
            return Err<Segment>(position.error());
        }
        const BmtPosition parent = position.value();
        const Segment root = chunk::root_hash_from_inclusion_proof(proof_chunk.sister_segments, calculated,
                                                                   segment_index, options.hash_fn);
        calculated = options.hash_fn({proof_chunk.span, root});
        segment_index = parent.chunk_index;

        reached_root = last_chunk_index == 0;
        last_chunk_index = shift_right(last_chunk_index, bmt_levels * (parent.level + 1));
    }

    if (!reached_root) {
        return reject("proof ends before the root chunk");
    }
    return Ok(calculated);
}

} // namespace bmt::file

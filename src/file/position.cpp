#include "bmt/file/position.hpp"

namespace bmt::file {

Result<BmtPosition> get_bmt_index_of_segment(std::size_t segment_index,
                                             std::size_t last_chunk_index,
                                             std::size_t max_chunk_payload_size) {
    chunk::ChunkOptions shape;
    shape.max_payload_size = max_chunk_payload_size;
    if (auto valid = chunk::validate_options(shape); valid.is_error()) {
        return Err<BmtPosition>(valid.error());
    }

    const std::size_t max_segment_count = chunk::max_segment_count(max_chunk_payload_size);
    const std::size_t chunk_bmt_levels = chunk::chunk_bmt_levels(max_chunk_payload_size);

    BmtPosition position;
    const bool in_carrier = segment_index / max_segment_count == last_chunk_index &&
                            last_chunk_index % max_segment_count == 0 &&
                            last_chunk_index != 0;

    segment_index >>= chunk_bmt_levels;
    if (in_carrier) {
        // Each full level the carrier skipped adds one to the level count.
        while (segment_index != 0 && segment_index % max_segment_count == 0) {
            ++position.level;
            segment_index >>= chunk_bmt_levels;
        }
    }

    position.chunk_index = segment_index;
    return Ok(position);
}

} // namespace bmt::file

#pragma once

#include "bmt/chunk/chunk.hpp"
#include "bmt/chunk/options.hpp"
#include "bmt/core/bytes.hpp"
#include "bmt/core/result.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace bmt::file {

struct FileOptions {
    chunk::ChunkOptions chunk;       ///< starting_span_value is ignored for file leaves
    std::size_t worker_threads = 0;  ///< Values above 1 hash independent chunks on a thread pool
};

/**
 * @brief One level of the file tree plus the carrier deferred past it
 */
struct TreeLevel {
    std::vector<chunk::Chunk> chunks;
    std::optional<chunk::Chunk> carrier;
};

/**
 * @brief Builds the multi-chunk tree of a file
 *
 * Leaves are payload slices of at most max_payload_size bytes. Each higher
 * level packs up to max_segment_count child addresses into one intermediate
 * chunk whose span is the sum of its children's spans.
 *
 * CARRIER CHUNKS:
 * When a level holds k * max_segment_count + 1 chunks, the last one would end
 * up as the only child of its parent. Instead it is popped and carried
 * upwards, and appended as the final child of the first higher level whose
 * chunk count is not a multiple of max_segment_count.
 */
class FileTreeBuilder {
public:
    static Result<FileTreeBuilder> create(FileOptions options = {});

    /// Slice @p payload into leaf chunks; an empty payload yields one empty chunk.
    Result<std::vector<chunk::Chunk>> split(ByteRange payload) const;

    /// Removes and returns the trailing carrier chunk of @p chunks, if any.
    std::optional<chunk::Chunk> pop_carrier_chunk(std::vector<chunk::Chunk>& chunks) const;

    Result<chunk::Chunk> create_intermediate_chunk(std::vector<chunk::Chunk>::const_iterator first,
                                                   std::vector<chunk::Chunk>::const_iterator last) const;

    /**
     * @brief Build the level above @p chunks
     *
     * A pending @p carrier is appended when the new level has room for it and
     * passed on otherwise. Without a pending carrier the new level is checked
     * for one of its own.
     */
    Result<TreeLevel> next_level(const std::vector<chunk::Chunk>& chunks,
                                 std::optional<chunk::Chunk> carrier) const;

    /// All levels from the leaves (carrier withheld) up to the single root chunk.
    Result<std::vector<TreeLevel>> build_levels(std::vector<chunk::Chunk> leaves) const;

    Result<chunk::Chunk> root_chunk(std::vector<chunk::Chunk> leaves) const;

    [[nodiscard]] const FileOptions& options() const noexcept { return options_; }
    [[nodiscard]] const chunk::ChunkHasher& hasher() const noexcept { return hasher_; }
    [[nodiscard]] std::size_t max_segment_count() const noexcept { return hasher_.max_segment_count(); }

private:
    FileTreeBuilder(FileOptions options, chunk::ChunkHasher hasher);

    template<typename MakeChunk>
    Result<std::vector<chunk::Chunk>> hash_all(std::size_t count, const MakeChunk& make_chunk) const;

    FileOptions options_;
    chunk::ChunkHasher hasher_;
};

/**
 * @brief A payload together with its complete chunk tree
 *
 * Built eagerly and immutable afterwards, so it can be shared across
 * threads. bmt() lists the levels leaf level first; carriers() holds, per
 * level, the carrier chunk still pending above it.
 */
class ChunkedFile {
public:
    static Result<ChunkedFile> create(Bytes payload, const FileOptions& options = {});

    [[nodiscard]] const Bytes& payload() const noexcept { return payload_; }
    [[nodiscard]] const std::vector<chunk::Chunk>& leaf_chunks() const noexcept { return leaves_; }
    [[nodiscard]] const std::vector<std::vector<chunk::Chunk>>& bmt() const noexcept { return levels_; }
    [[nodiscard]] const std::vector<std::optional<chunk::Chunk>>& carriers() const noexcept { return carriers_; }
    [[nodiscard]] const chunk::Chunk& root_chunk() const noexcept { return levels_.back().front(); }
    [[nodiscard]] const Segment& address() const noexcept { return root_chunk().address(); }
    [[nodiscard]] const Bytes& span() const noexcept { return root_chunk().span(); }
    [[nodiscard]] std::uint32_t span_value() const noexcept { return root_chunk().span_value(); }
    [[nodiscard]] const FileTreeBuilder& builder() const noexcept { return builder_; }

private:
    ChunkedFile(Bytes payload,
                FileTreeBuilder builder,
                std::vector<chunk::Chunk> leaves,
                std::vector<TreeLevel> levels);

    Bytes payload_;
    FileTreeBuilder builder_;
    std::vector<chunk::Chunk> leaves_;
    std::vector<std::vector<chunk::Chunk>> levels_;
    std::vector<std::optional<chunk::Chunk>> carriers_;
};

Result<ChunkedFile> make_chunked_file(Bytes payload, const FileOptions& options = {});

} // namespace bmt::file

#include "bmt/file/tree_builder.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using bmt::chunk::Chunk;

namespace bmt::file {

// ──────────────────────────────────────────────────────────
// FileTreeBuilder
// ──────────────────────────────────────────────────────────

FileTreeBuilder::FileTreeBuilder(FileOptions options, chunk::ChunkHasher hasher)
    : options_(std::move(options))
    , hasher_(std::move(hasher)) {}

Result<FileTreeBuilder> FileTreeBuilder::create(FileOptions options) {
    // Leaves always carry their own length.
    chunk::ChunkOptions chunk_options = options.chunk;
    chunk_options.starting_span_value.reset();

    auto hasher = chunk::ChunkHasher::create(std::move(chunk_options));
    if (hasher.is_error()) {
        return Err<FileTreeBuilder>(hasher.error());
    }
    return Ok(FileTreeBuilder(std::move(options), std::move(hasher.value())));
}

template<typename MakeChunk>
Result<std::vector<Chunk>> FileTreeBuilder::hash_all(std::size_t count, const MakeChunk& make_chunk) const {
    std::vector<std::optional<Result<Chunk>>> slots(count);

    const std::size_t workers = std::min(options_.worker_threads, count);
    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            slots[i].emplace(make_chunk(i));
        }
    } else {
        // Chunks of one level are independent; each task writes its own slot.
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < count; ++i) {
            boost::asio::post(pool, [&slots, &make_chunk, i] {
                slots[i].emplace(make_chunk(i));
            });
        }
        pool.join();
    }

    std::vector<Chunk> chunks;
    chunks.reserve(count);
    for (auto& slot : slots) {
        if (slot->is_error()) {
            return Err<std::vector<Chunk>>(slot->error());
        }
        chunks.push_back(std::move(slot->value()));
    }
    return Ok(std::move(chunks));
}

Result<std::vector<Chunk>> FileTreeBuilder::split(ByteRange payload) const {
    if (payload.empty()) {
        auto empty = hasher_.make_chunk(Bytes{}, 0);
        if (empty.is_error()) {
            return Err<std::vector<Chunk>>(empty.error());
        }
        std::vector<Chunk> leaves;
        leaves.push_back(std::move(empty.value()));
        return Ok(std::move(leaves));
    }

    const std::size_t max_payload = hasher_.max_payload_size();
    const std::size_t count = (payload.size + max_payload - 1) / max_payload;

    return hash_all(count, [this, payload, max_payload](std::size_t i) {
        const ByteRange piece = payload.slice(i * max_payload, max_payload);
        return hasher_.make_chunk(Bytes(piece.data, piece.data + piece.size),
                                  static_cast<std::int64_t>(piece.size));
    });
}

std::optional<Chunk> FileTreeBuilder::pop_carrier_chunk(std::vector<Chunk>& chunks) const {
    if (chunks.size() <= 1) {
        return std::nullopt;
    }
    if (chunks.size() % max_segment_count() != 1) {
        return std::nullopt;
    }

    std::optional<Chunk> carrier(std::move(chunks.back()));
    chunks.pop_back();
    return carrier;
}

Result<Chunk> FileTreeBuilder::create_intermediate_chunk(std::vector<Chunk>::const_iterator first,
                                                         std::vector<Chunk>::const_iterator last) const {
    Bytes payload;
    payload.reserve(static_cast<std::size_t>(std::distance(first, last)) * kSegmentSize);

    std::int64_t span_sum = 0;
    for (auto it = first; it != last; ++it) {
        payload.insert(payload.end(), it->address().begin(), it->address().end());
        span_sum += it->span_value();
    }

    return hasher_.make_chunk(std::move(payload), span_sum);
}

Result<TreeLevel> FileTreeBuilder::next_level(const std::vector<Chunk>& chunks,
                                              std::optional<Chunk> carrier) const {
    if (chunks.empty()) {
        return Err<TreeLevel>(ErrorCode::EmptyChunkSet, "the given chunk array is empty");
    }

    const std::size_t batch = max_segment_count();
    const std::size_t parent_count = (chunks.size() + batch - 1) / batch;

    auto parents = hash_all(parent_count, [this, &chunks, batch](std::size_t i) {
        const auto first = chunks.begin() + static_cast<std::ptrdiff_t>(i * batch);
        const auto last = chunks.begin() + static_cast<std::ptrdiff_t>(std::min((i + 1) * batch, chunks.size()));
        return create_intermediate_chunk(first, last);
    });
    if (parents.is_error()) {
        return Err<TreeLevel>(parents.error());
    }

    TreeLevel level;
    level.chunks = std::move(parents.value());

    if (carrier) {
        if (level.chunks.size() % batch != 0) {
            spdlog::debug("Merging carrier chunk {} as child {} of the next level",
                          to_hex(carrier->address()), level.chunks.size());
            level.chunks.push_back(std::move(*carrier));
        } else {
            level.carrier = std::move(carrier);
        }
    } else {
        level.carrier = pop_carrier_chunk(level.chunks);
        if (level.carrier) {
            spdlog::debug("Deferring carrier chunk {}", to_hex(level.carrier->address()));
        }
    }

    return Ok(std::move(level));
}

Result<std::vector<TreeLevel>> FileTreeBuilder::build_levels(std::vector<Chunk> leaves) const {
    if (leaves.empty()) {
        return Err<std::vector<TreeLevel>>(ErrorCode::EmptyChunkSet, "given chunk array is empty");
    }

    std::vector<TreeLevel> levels(1);
    levels[0].carrier = pop_carrier_chunk(leaves);
    levels[0].chunks = std::move(leaves);

    while (levels.back().chunks.size() != 1 || levels.back().carrier) {
        auto next = next_level(levels.back().chunks, levels.back().carrier);
        if (next.is_error()) {
            return Err<std::vector<TreeLevel>>(next.error());
        }
        spdlog::debug("BMT level {}: {} chunks{}", levels.size(), next.value().chunks.size(),
                      next.value().carrier ? ", carrier pending" : "");
        levels.push_back(std::move(next.value()));
    }

    return Ok(std::move(levels));
}

Result<Chunk> FileTreeBuilder::root_chunk(std::vector<Chunk> leaves) const {
    if (leaves.empty()) {
        return Err<Chunk>(ErrorCode::EmptyChunkSet, "given chunk array is empty");
    }

    TreeLevel current;
    current.carrier = pop_carrier_chunk(leaves);
    current.chunks = std::move(leaves);

    while (current.chunks.size() != 1 || current.carrier) {
        auto next = next_level(current.chunks, current.carrier);
        if (next.is_error()) {
            return Err<Chunk>(next.error());
        }
        current = std::move(next.value());
    }

    return Ok(std::move(current.chunks.front()));
}

// ──────────────────────────────────────────────────────────
// ChunkedFile
// ──────────────────────────────────────────────────────────

ChunkedFile::ChunkedFile(Bytes payload,
                         FileTreeBuilder builder,
                         std::vector<Chunk> leaves,
                         std::vector<TreeLevel> levels)
    : payload_(std::move(payload))
    , builder_(std::move(builder))
    , leaves_(std::move(leaves)) {
    levels_.reserve(levels.size());
    carriers_.reserve(levels.size());
    for (auto& level : levels) {
        levels_.push_back(std::move(level.chunks));
        carriers_.push_back(std::move(level.carrier));
    }
}

Result<ChunkedFile> ChunkedFile::create(Bytes payload, const FileOptions& options) {
    auto builder = FileTreeBuilder::create(options);
    if (builder.is_error()) {
        return Err<ChunkedFile>(builder.error());
    }

    auto leaves = builder.value().split(payload);
    if (leaves.is_error()) {
        return Err<ChunkedFile>(leaves.error());
    }

    // Leaf copies share their payload buffers with the tree.
    std::vector<Chunk> leaf_chunks = leaves.value();
    auto levels = builder.value().build_levels(std::move(leaves.value()));
    if (levels.is_error()) {
        return Err<ChunkedFile>(levels.error());
    }

    ChunkedFile file(std::move(payload), std::move(builder.value()), std::move(leaf_chunks),
                     std::move(levels.value()));
    spdlog::debug("Chunked {} bytes into {} leaves and {} levels, address {}",
                  file.payload().size(), file.leaf_chunks().size(), file.bmt().size(),
                  to_hex(file.address()));
    return Ok(std::move(file));
}

Result<ChunkedFile> make_chunked_file(Bytes payload, const FileOptions& options) {
    return ChunkedFile::create(std::move(payload), options);
}

} // namespace bmt::file

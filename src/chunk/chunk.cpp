#include "bmt/chunk/chunk.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace bmt::chunk {
namespace {

// One BMT round: hash every 64-byte segment pair of @p level into 32 bytes.
Bytes hash_level(const Bytes& level, const crypto::HashFunction& hash_fn) {
    Bytes next(level.size() / 2);
    for (std::size_t offset = 0; offset < level.size(); offset += kSegmentPairSize) {
        const Segment digest = hash_fn({ByteRange(level.data() + offset, kSegmentPairSize)});
        std::memcpy(next.data() + offset / 2, digest.data(), digest.size());
    }
    return next;
}

} // namespace

// ──────────────────────────────────────────────────────────
// ChunkHasher
// ──────────────────────────────────────────────────────────

ChunkHasher::ChunkHasher(std::shared_ptr<const ChunkOptions> options)
    : options_(std::move(options)) {}

Result<ChunkHasher> ChunkHasher::create(ChunkOptions options) {
    if (auto valid = validate_options(options); valid.is_error()) {
        return Err<ChunkHasher>(valid.error());
    }
    return Ok(ChunkHasher(std::make_shared<const ChunkOptions>(std::move(options))));
}

std::size_t ChunkHasher::max_segment_count() const noexcept {
    return chunk::max_segment_count(options_->max_payload_size);
}

Result<Bytes> ChunkHasher::padded(ByteRange payload) const {
    if (payload.size > options_->max_payload_size) {
        return Err<Bytes>(ErrorCode::InvalidPayloadLength,
                          "invalid data length " + std::to_string(payload.size) + " (max " +
                              std::to_string(options_->max_payload_size) + ")");
    }
    Bytes data(options_->max_payload_size, 0);
    if (!payload.empty()) {
        std::memcpy(data.data(), payload.data, payload.size);
    }
    return Ok(std::move(data));
}

Result<Chunk> ChunkHasher::make_chunk(Bytes payload, std::optional<std::int64_t> span_value) const {
    auto root = root_hash(payload);
    if (root.is_error()) {
        return Err<Chunk>(root.error());
    }

    const std::int64_t value = span_value ? *span_value
                             : options_->starting_span_value ? *options_->starting_span_value
                             : static_cast<std::int64_t>(payload.size());
    auto span = make_span(value, options_->span_length);
    if (span.is_error()) {
        return Err<Chunk>(span.error());
    }

    const Segment address = chunk_address(span.value(), root.value());
    return Ok(Chunk(*this, std::move(payload), static_cast<std::uint32_t>(value),
                    std::move(span.value()), address));
}

Result<std::vector<Bytes>> ChunkHasher::bmt(ByteRange payload) const {
    auto data = padded(payload);
    if (data.is_error()) {
        return Err<std::vector<Bytes>>(data.error());
    }

    std::vector<Bytes> levels;
    levels.push_back(std::move(data.value()));
    while (levels.back().size() != crypto::kHashSize) {
        levels.push_back(hash_level(levels.back(), options_->hash_fn));
    }
    return Ok(std::move(levels));
}

Result<Segment> ChunkHasher::root_hash(ByteRange payload) const {
    auto data = padded(payload);
    if (data.is_error()) {
        return Err<Segment>(data.error());
    }

    Bytes level = std::move(data.value());
    while (level.size() != crypto::kHashSize) {
        level = hash_level(level, options_->hash_fn);
    }

    Segment root{};
    std::memcpy(root.data(), level.data(), root.size());
    return Ok(root);
}

Result<std::vector<Segment>> ChunkHasher::inclusion_proof(ByteRange payload, std::size_t segment_index) const {
    if (segment_index >= (payload.size + kSegmentSize - 1) / kSegmentSize) {
        return Err<std::vector<Segment>>(
            ErrorCode::InvalidSegmentIndex,
            "segment index " + std::to_string(segment_index) + " is beyond the " +
                std::to_string(payload.size / kSegmentSize) + " segments of the data");
    }

    auto tree = bmt(payload);
    if (tree.is_error()) {
        return Err<std::vector<Segment>>(tree.error());
    }

    const auto& levels = tree.value();
    std::vector<Segment> sister_segments;
    sister_segments.reserve(levels.size() - 1);
    for (std::size_t level = 0; level + 1 < levels.size(); ++level) {
        const std::size_t sister_index = segment_index ^ 1u;
        sister_segments.push_back(segment_at(levels[level], sister_index));
        segment_index >>= 1;
    }
    return Ok(std::move(sister_segments));
}

Segment ChunkHasher::root_hash_from_inclusion_proof(const std::vector<Segment>& proof_segments,
                                                    const Segment& prove_segment,
                                                    std::size_t prove_segment_index) const {
    return chunk::root_hash_from_inclusion_proof(proof_segments, prove_segment, prove_segment_index,
                                                 options_->hash_fn);
}

Segment ChunkHasher::chunk_address(ByteRange span, const Segment& root_hash) const {
    return options_->hash_fn({span, root_hash});
}

// ──────────────────────────────────────────────────────────
// Chunk
// ──────────────────────────────────────────────────────────

Chunk::Chunk(ChunkHasher hasher, Bytes payload, std::uint32_t span_value, Bytes span, const Segment& address)
    : hasher_(std::move(hasher))
    , payload_(std::make_shared<const Bytes>(std::move(payload)))
    , span_value_(span_value)
    , span_(std::move(span))
    , address_(address) {}

Bytes Chunk::data() const {
    Bytes data(*payload_);
    data.resize(hasher_.max_payload_size(), 0);
    return data;
}

std::vector<Bytes> Chunk::bmt() const {
    // The payload was validated against max_payload_size on creation.
    return hasher_.bmt(*payload_).value();
}

Result<std::vector<Segment>> Chunk::inclusion_proof(std::size_t segment_index) const {
    return hasher_.inclusion_proof(data(), segment_index);
}

// ──────────────────────────────────────────────────────────
// Free functions
// ──────────────────────────────────────────────────────────

Result<Chunk> make_chunk(Bytes payload, const ChunkOptions& options) {
    auto hasher = ChunkHasher::create(options);
    if (hasher.is_error()) {
        return Err<Chunk>(hasher.error());
    }
    return hasher.value().make_chunk(std::move(payload));
}

Segment root_hash_from_inclusion_proof(const std::vector<Segment>& proof_segments,
                                       const Segment& prove_segment,
                                       std::size_t prove_segment_index,
                                       const crypto::HashFunction& hash_fn) {
    Segment calculated = prove_segment;
    for (const auto& proof_segment : proof_segments) {
        const bool merge_from_right = prove_segment_index % 2 == 0;
        calculated = merge_from_right ? hash_fn({calculated, proof_segment})
                                      : hash_fn({proof_segment, calculated});
        prove_segment_index >>= 1;
    }
    return calculated;
}

} // namespace bmt::chunk

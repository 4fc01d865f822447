#pragma once

#include "bmt/chunk/options.hpp"
#include "bmt/chunk/span.hpp"
#include "bmt/core/bytes.hpp"
#include "bmt/core/result.hpp"
#include "bmt/crypto/hash.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace bmt::chunk {

class Chunk;

/**
 * @brief Builds the Binary Merkle Tree of a single chunk
 *
 * The payload is zero-padded to max_payload_size and hashed in 64-byte
 * segment pairs, level by level, until one 32-byte root remains. The chunk
 * address is hash(span || root).
 *
 * Instances are immutable and cheap to copy; every Chunk keeps the hasher
 * that produced it so that its derived views can be recomputed.
 */
class ChunkHasher {
public:
    static Result<ChunkHasher> create(ChunkOptions options = {});

    /**
     * @brief Hash @p payload into a chunk
     *
     * @param span_value Span to record; falls back to starting_span_value and
     *                   then to the payload length
     */
    Result<Chunk> make_chunk(Bytes payload, std::optional<std::int64_t> span_value = std::nullopt) const;

    /// Every BMT level of the padded payload, data level first, root last.
    Result<std::vector<Bytes>> bmt(ByteRange payload) const;

    Result<Segment> root_hash(ByteRange payload) const;

    /**
     * @brief Sister segments proving @p segment_index, bottom-up
     *
     * Fails with InvalidSegmentIndex when the segment starts at or past the end
     * of @p payload.
     */
    Result<std::vector<Segment>> inclusion_proof(ByteRange payload, std::size_t segment_index) const;

    /// Folds a proof back into the BMT root (not the chunk address).
    Segment root_hash_from_inclusion_proof(const std::vector<Segment>& proof_segments,
                                           const Segment& prove_segment,
                                           std::size_t prove_segment_index) const;

    Segment chunk_address(ByteRange span, const Segment& root_hash) const;

    [[nodiscard]] const ChunkOptions& options() const noexcept { return *options_; }
    [[nodiscard]] std::size_t max_payload_size() const noexcept { return options_->max_payload_size; }
    [[nodiscard]] std::size_t max_segment_count() const noexcept;

private:
    explicit ChunkHasher(std::shared_ptr<const ChunkOptions> options);

    Result<Bytes> padded(ByteRange payload) const;

    std::shared_ptr<const ChunkOptions> options_;
};

/**
 * @brief Immutable content-addressed chunk
 *
 * Holds the raw payload (at most max_payload_size bytes) and its span. The
 * address is computed once on creation; data(), bmt() and inclusion_proof()
 * are recomputed from the payload on every call. Copies share the payload
 * buffer.
 *
 * Two chunks compare equal iff their addresses are equal.
 */
class Chunk {
public:
    [[nodiscard]] const Bytes& payload() const noexcept { return *payload_; }
    [[nodiscard]] std::uint32_t span_value() const noexcept { return span_value_; }
    [[nodiscard]] const Bytes& span() const noexcept { return span_; }
    [[nodiscard]] const Segment& address() const noexcept { return address_; }

    /// Payload zero-padded to max_payload_size.
    [[nodiscard]] Bytes data() const;

    [[nodiscard]] std::vector<Bytes> bmt() const;

    /// Sister segments for segment @p segment_index of data().
    [[nodiscard]] Result<std::vector<Segment>> inclusion_proof(std::size_t segment_index) const;

    [[nodiscard]] std::size_t max_payload_size() const noexcept { return hasher_.max_payload_size(); }
    [[nodiscard]] std::size_t span_length() const noexcept { return span_.size(); }
    [[nodiscard]] const ChunkHasher& hasher() const noexcept { return hasher_; }

    bool operator==(const Chunk& other) const noexcept { return address_ == other.address_; }
    bool operator!=(const Chunk& other) const noexcept { return !(*this == other); }

private:
    friend class ChunkHasher;

    Chunk(ChunkHasher hasher, Bytes payload, std::uint32_t span_value, Bytes span, const Segment& address);

    ChunkHasher hasher_;
    std::shared_ptr<const Bytes> payload_;
    std::uint32_t span_value_ = 0;
    Bytes span_;
    Segment address_{};
};

/// Validates @p options and hashes @p payload into a chunk.
Result<Chunk> make_chunk(Bytes payload, const ChunkOptions& options = {});

/**
 * @brief Fold sister segments into a BMT root
 *
 * For each proof segment: hash(current, sister) when the running index is
 * even, hash(sister, current) when odd; then halve the index.
 */
Segment root_hash_from_inclusion_proof(const std::vector<Segment>& proof_segments,
                                       const Segment& prove_segment,
                                       std::size_t prove_segment_index,
                                       const crypto::HashFunction& hash_fn = crypto::keccak256);

} // namespace bmt::chunk

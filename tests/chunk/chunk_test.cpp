#include "bmt/chunk/chunk.hpp"

#include <gtest/gtest.h>

#include <limits>

using bmt::Bytes;
using bmt::ErrorCode;
using bmt::Segment;
using bmt::chunk::Chunk;
using bmt::chunk::ChunkHasher;
using bmt::chunk::ChunkOptions;

namespace {

Bytes pattern(std::size_t size, std::size_t seed = 0) {
    Bytes bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>((i + seed) % 251);
    }
    return bytes;
}

Chunk must_make_chunk(Bytes payload, const ChunkOptions& options = {}) {
    auto chunk = bmt::chunk::make_chunk(std::move(payload), options);
    EXPECT_TRUE(chunk.is_ok()) << bmt::describe(chunk.error());
    return chunk.value();
}

// Recomputes the chunk address from the proof of every segment of data().
void expect_all_segments_provable(const Chunk& chunk, const bmt::crypto::HashFunction& hash_fn) {
    const Bytes data = chunk.data();
    const std::size_t segments = data.size() / bmt::kSegmentSize;
    for (std::size_t i = 0; i < segments; ++i) {
        auto proof = chunk.inclusion_proof(i);
        ASSERT_TRUE(proof.is_ok()) << "segment " << i;
        const Segment root = bmt::chunk::root_hash_from_inclusion_proof(
            proof.value(), bmt::segment_at(data, i), i, hash_fn);
        EXPECT_EQ(hash_fn({chunk.span(), root}), chunk.address()) << "segment " << i;
    }
}

} // namespace

TEST(ChunkTest, EmptyPayloadGoldenAddress) {
    const Chunk chunk = must_make_chunk({});
    EXPECT_EQ(bmt::to_hex(chunk.address()),
              "b34ca8c22b9e982354f9c7f50b470d66db428d880c8a904d5fe4ec9713171526");
    EXPECT_EQ(chunk.span_value(), 0u);
}

TEST(ChunkTest, SmallPayloadGoldenAddress) {
    const Chunk chunk = must_make_chunk({1, 2, 3});
    EXPECT_EQ(bmt::to_hex(chunk.address()),
              "ca6357a08e317d15ec560fef34e4c45f8f19f01c372aa70f1da72bfa7f1a4338");
    EXPECT_EQ(chunk.span(), (Bytes{3, 0, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(chunk.payload(), (Bytes{1, 2, 3}));
}

TEST(ChunkTest, FullPayloadGoldenAddress) {
    const Chunk chunk = must_make_chunk(pattern(4096));
    EXPECT_EQ(bmt::to_hex(chunk.address()),
              "24c36e7da40d7f78778f2eb41eb7ee7ec9a5084586331218c3654bc642baafad");
}

TEST(ChunkTest, DataIsPaddedToMaxPayloadSize) {
    for (std::size_t size : {0u, 1u, 31u, 32u, 33u, 4095u, 4096u}) {
        const Chunk chunk = must_make_chunk(pattern(size));
        const Bytes data = chunk.data();
        ASSERT_EQ(data.size(), 4096u);
        EXPECT_EQ(chunk.address().size(), 32u);
        EXPECT_TRUE(bmt::bytes_equal(bmt::ByteRange(data).slice(0, size), chunk.payload()));
        for (std::size_t i = size; i < data.size(); ++i) {
            ASSERT_EQ(data[i], 0) << "offset " << i;
        }
    }
}

TEST(ChunkTest, BmtLevelsHalveUpToTheRoot) {
    const Chunk chunk = must_make_chunk({1, 2, 3});
    const auto levels = chunk.bmt();

    ASSERT_EQ(levels.size(), 8u);
    EXPECT_EQ(levels.front().size(), 4096u);
    EXPECT_EQ(levels.back().size(), 32u);
    for (std::size_t i = 1; i < levels.size(); ++i) {
        EXPECT_EQ(levels[i].size() * 2, levels[i - 1].size());
    }

    auto root = chunk.hasher().root_hash(chunk.payload());
    ASSERT_TRUE(root.is_ok());
    EXPECT_TRUE(bmt::bytes_equal(levels.back(), root.value()));
    EXPECT_EQ(chunk.hasher().chunk_address(chunk.span(), root.value()), chunk.address());
}

TEST(ChunkTest, EverySegmentProvesTheAddress) {
    expect_all_segments_provable(must_make_chunk({1, 2, 3}), bmt::crypto::keccak256);
    expect_all_segments_provable(must_make_chunk(pattern(4000, 17)), bmt::crypto::keccak256);
}

TEST(ChunkTest, ProofHasOneSisterPerLevel) {
    const Chunk chunk = must_make_chunk(pattern(100));
    auto proof = chunk.inclusion_proof(5);
    ASSERT_TRUE(proof.is_ok());
    ASSERT_EQ(proof.value().size(), 7u);
    // The first sister is segment 4 of the data itself.
    EXPECT_EQ(proof.value().front(), bmt::segment_at(chunk.data(), 4));
}

TEST(ChunkTest, ProofIndexMustAddressData) {
    const Chunk chunk = must_make_chunk({1, 2, 3});
    auto out_of_range = chunk.inclusion_proof(128);
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::InvalidSegmentIndex);

    // Unpadded payloads only expose their own segments.
    const ChunkHasher hasher = ChunkHasher::create().value();
    EXPECT_TRUE(hasher.inclusion_proof(pattern(64), 1).is_ok());
    auto past_payload = hasher.inclusion_proof(pattern(64), 2);
    ASSERT_TRUE(past_payload.is_error());
    EXPECT_EQ(past_payload.error().code, ErrorCode::InvalidSegmentIndex);

    // Indices whose byte offset would not fit in size_t.
    for (std::size_t huge : {std::size_t{1} << 59, std::numeric_limits<std::size_t>::max()}) {
        auto wrapped = chunk.inclusion_proof(huge);
        ASSERT_TRUE(wrapped.is_error()) << "index " << huge;
        EXPECT_EQ(wrapped.error().code, ErrorCode::InvalidSegmentIndex);
    }
}

TEST(ChunkTest, RejectsOversizedPayload) {
    auto chunk = bmt::chunk::make_chunk(pattern(4097));
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ErrorCode::InvalidPayloadLength);
}

TEST(ChunkTest, ExplicitSpanValue) {
    const ChunkHasher hasher = ChunkHasher::create().value();
    auto chunk = hasher.make_chunk({1, 2, 3}, 1000);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(chunk.value().span_value(), 1000u);
    EXPECT_NE(chunk.value(), must_make_chunk({1, 2, 3}));

    auto invalid = hasher.make_chunk({1, 2, 3}, -5);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidSpanValue);
}

TEST(ChunkTest, StartingSpanValueOption) {
    ChunkOptions options;
    options.starting_span_value = 8192;
    const Chunk chunk = must_make_chunk({1, 2, 3}, options);
    EXPECT_EQ(chunk.span_value(), 8192u);
    EXPECT_EQ(chunk.span(), (Bytes{0x00, 0x20, 0, 0, 0, 0, 0, 0}));
}

TEST(ChunkTest, EqualityFollowsAddress) {
    EXPECT_EQ(must_make_chunk({1, 2, 3}), must_make_chunk({1, 2, 3}));
    EXPECT_NE(must_make_chunk({1, 2, 3}), must_make_chunk({1, 2, 4}));
}

TEST(ChunkTest, SmallerChunkSize) {
    ChunkOptions options;
    options.max_payload_size = 128;
    const Chunk chunk = must_make_chunk(pattern(100), options);

    EXPECT_EQ(chunk.data().size(), 128u);
    EXPECT_EQ(chunk.bmt().size(), 3u);
    EXPECT_EQ(chunk.max_payload_size(), 128u);
    expect_all_segments_provable(chunk, options.hash_fn);
}

TEST(ChunkTest, CustomHashFunction) {
    ChunkOptions options;
    options.hash_fn = [](std::initializer_list<bmt::ByteRange> parts) {
        Segment digest{};
        std::size_t i = 0;
        for (const auto& part : parts) {
            for (std::size_t j = 0; j < part.size; ++j, ++i) {
                digest[i % digest.size()] ^= part.data[j];
            }
        }
        return digest;
    };
    options.span_length = 4;

    const Chunk chunk = must_make_chunk(pattern(300), options);
    EXPECT_EQ(chunk.span_length(), 4u);
    EXPECT_NE(chunk.address(), must_make_chunk(pattern(300)).address());
    expect_all_segments_provable(chunk, options.hash_fn);
}

TEST(ChunkOptionsTest, RejectsInvalidConfigurations) {
    ChunkOptions not_power_of_two;
    not_power_of_two.max_payload_size = 100;
    ChunkOptions too_small;
    too_small.max_payload_size = 32;
    ChunkOptions short_span;
    short_span.span_length = 2;
    ChunkOptions no_hash;
    no_hash.hash_fn = nullptr;

    for (const auto& options : {not_power_of_two, too_small, short_span, no_hash}) {
        auto hasher = ChunkHasher::create(options);
        ASSERT_TRUE(hasher.is_error());
        EXPECT_EQ(hasher.error().code, ErrorCode::InvalidOptions);
    }
}

TEST(ChunkOptionsTest, TreeShapeHelpers) {
    EXPECT_EQ(bmt::chunk::max_segment_count(4096), 128u);
    EXPECT_EQ(bmt::chunk::chunk_bmt_levels(4096), 7u);
    EXPECT_EQ(bmt::chunk::max_segment_count(64), 2u);
    EXPECT_EQ(bmt::chunk::chunk_bmt_levels(64), 1u);
}

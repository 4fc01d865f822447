#pragma once

#include "bmt/core/bytes.hpp"

#include <functional>
#include <initializer_list>

namespace bmt::crypto {

inline constexpr std::size_t kHashSize = 32;

using Hash256 = Segment;

/**
 * @brief Pluggable tree hash
 *
 * Receives any number of byte ranges and hashes their concatenation into a
 * 32-byte digest. Must be deterministic; must also be safe to call from
 * several threads when tree construction runs on worker threads.
 */
using HashFunction = std::function<Hash256(std::initializer_list<ByteRange>)>;

/**
 * @brief Keccak-256 of the concatenated ranges
 *
 * This is the original Keccak submission padding (0x01), as used by
 * Ethereum and Swarm, not FIPS-202 SHA3-256.
 */
Hash256 keccak256(std::initializer_list<ByteRange> parts);

} // namespace bmt::crypto

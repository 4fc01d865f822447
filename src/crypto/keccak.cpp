#include "bmt/crypto/hash.hpp"

#include <cryptopp/keccak.h>

namespace bmt::crypto {

static_assert(CryptoPP::Keccak_256::DIGESTSIZE == kHashSize, "Keccak-256 digest must fill one segment");

Hash256 keccak256(std::initializer_list<ByteRange> parts) {
    CryptoPP::Keccak_256 hasher;
    for (const auto& part : parts) {
        if (!part.empty()) {
            hasher.Update(part.data, part.size);
        }
    }

    Hash256 digest{};
    hasher.Final(digest.data());
    return digest;
}

} // namespace bmt::crypto

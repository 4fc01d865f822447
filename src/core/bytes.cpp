#include "bmt/core/bytes.hpp"

#include <algorithm>
#include <cstring>

namespace bmt {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

ByteRange ByteRange::slice(std::size_t offset, std::size_t length) const noexcept {
    if (offset >= size) {
        return ByteRange(data + size, 0);
    }
    return ByteRange(data + offset, std::min(length, size - offset));
}

std::string to_hex(ByteRange bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size * 2);
    for (std::size_t i = 0; i < bytes.size; ++i) {
        out.push_back(kDigits[bytes.data[i] >> 4]);
        out.push_back(kDigits[bytes.data[i] & 0x0f]);
    }
    return out;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::InvalidHex,
                          "hex string has odd length " + std::to_string(hex.size()));
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(ErrorCode::InvalidHex,
                              "invalid hex digit at offset " + std::to_string(i));
        }
        out.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return Ok(std::move(out));
}

Result<Segment> segment_from_hex(std::string_view hex) {
    auto decoded = from_hex(hex);
    if (decoded.is_error()) {
        return Err<Segment>(decoded.error());
    }
    if (decoded.value().size() != kSegmentSize) {
        return Err<Segment>(ErrorCode::InvalidHex,
                            "expected " + std::to_string(kSegmentSize) + " bytes, got " +
                                std::to_string(decoded.value().size()));
    }
    Segment segment{};
    std::copy(decoded.value().begin(), decoded.value().end(), segment.begin());
    return Ok(segment);
}

bool bytes_equal(ByteRange lhs, ByteRange rhs) noexcept {
    if (lhs.size != rhs.size) {
        return false;
    }
    return lhs.size == 0 || std::memcmp(lhs.data, rhs.data, lhs.size) == 0;
}

Bytes concat_bytes(std::initializer_list<ByteRange> parts) {
    std::size_t total = 0;
    for (const auto& part : parts) {
        total += part.size;
    }

    Bytes out;
    out.reserve(total);
    for (const auto& part : parts) {
        out.insert(out.end(), part.data, part.data + part.size);
    }
    return out;
}

Segment segment_at(ByteRange data, std::size_t segment_index) {
    Segment segment{};
    const ByteRange piece = data.slice(segment_index * kSegmentSize, kSegmentSize);
    if (!piece.empty()) {
        std::memcpy(segment.data(), piece.data, piece.size);
    }
    return segment;
}

} // namespace bmt

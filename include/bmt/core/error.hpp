#pragma once

#include <string>
#include <utility>

namespace bmt {

enum class ErrorCode {
    InvalidPayloadLength, ///< Payload exceeds the configured max payload size
    InvalidSegmentIndex,  ///< Segment index beyond the addressable data or file range
    InvalidSpanValue,     ///< Span value negative or above 2^32 - 1
    EmptyChunkSet,        ///< Tree construction invoked on zero chunks
    InvalidProof,         ///< Proof list malformed or inconsistent with its claimed span
    InvalidOptions,       ///< ChunkOptions that cannot describe a BMT
    InvalidHex            ///< Malformed hex text
};

/**
 * @brief Error value carried by bmt::Result
 *
 * Every failure is a synchronous value error raised where the violation is
 * detected. Operations are pure, so retrying with the same input cannot succeed.
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidProof;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPayloadLength: return "InvalidPayloadLength";
        case ErrorCode::InvalidSegmentIndex: return "InvalidSegmentIndex";
        case ErrorCode::InvalidSpanValue: return "InvalidSpanValue";
        case ErrorCode::EmptyChunkSet: return "EmptyChunkSet";
        case ErrorCode::InvalidProof: return "InvalidProof";
        case ErrorCode::InvalidOptions: return "InvalidOptions";
        case ErrorCode::InvalidHex: return "InvalidHex";
    }
    return "Unknown";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.code)) + ": " + error.message;
}

} // namespace bmt

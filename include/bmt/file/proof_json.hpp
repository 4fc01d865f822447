#pragma once

/**
 * @file proof_json.hpp
 * @brief JSON form of file inclusion proofs
 *
 * FORMAT:
 * [
 *   {"span": "0010000000000000", "sister_segments": ["<64 hex digits>", ...]},
 *   ...
 * ]
 *
 * Entries keep the bottom-up order of file_inclusion_proof_bottom_up.
 * Decoding accepts an optional "0x" prefix on every hex string.
 */

#include "bmt/core/result.hpp"
#include "bmt/file/inclusion_proof.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace bmt::file {

nlohmann::json proofs_to_json(const std::vector<ChunkInclusionProof>& proofs);

/// Fails with InvalidProof on a wrong shape and InvalidHex on bad hex text.
Result<std::vector<ChunkInclusionProof>> proofs_from_json(const nlohmann::json& json);

/// Parses JSON text and decodes it with proofs_from_json.
Result<std::vector<ChunkInclusionProof>> parse_proofs(std::string_view text);

} // namespace bmt::file

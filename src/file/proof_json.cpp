#include "bmt/file/proof_json.hpp"

#include <string>
#include <utility>

using json = nlohmann::json;

namespace bmt::file {

using ProofList = std::vector<ChunkInclusionProof>;

json proofs_to_json(const ProofList& proofs) {
    json array = json::array();
    for (const auto& proof : proofs) {
        json sisters = json::array();
        for (const auto& segment : proof.sister_segments) {
            sisters.push_back(to_hex(segment));
        }
        json entry = {
            {"span", to_hex(proof.span)},
            {"sister_segments", sisters}
        };
        array.push_back(std::move(entry));
    }
    return array;
}

Result<ProofList> proofs_from_json(const json& document) {
    if (!document.is_array()) {
        return Err<ProofList>(ErrorCode::InvalidProof, "proof JSON must be an array");
    }

    ProofList proofs;
    proofs.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        const json& entry = document[i];
        const std::string where = "proof entry " + std::to_string(i);

        if (!entry.is_object() || !entry.contains("span") || !entry.contains("sister_segments")) {
            return Err<ProofList>(ErrorCode::InvalidProof, where + " needs \"span\" and \"sister_segments\"");
        }
        if (!entry["span"].is_string() || !entry["sister_segments"].is_array()) {
            return Err<ProofList>(ErrorCode::InvalidProof, where + " has fields of the wrong type");
        }

        ChunkInclusionProof proof;
        auto span = from_hex(entry["span"].get<std::string>());
        if (span.is_error()) {
            return Err<ProofList>(span.error());
        }
        proof.span = std::move(span.value());

        for (const auto& sister : entry["sister_segments"]) {
            if (!sister.is_string()) {
                return Err<ProofList>(ErrorCode::InvalidProof, where + " has a non-string sister segment");
            }
            auto segment = segment_from_hex(sister.get<std::string>());
            if (segment.is_error()) {
                return Err<ProofList>(segment.error());
            }
            proof.sister_segments.push_back(segment.value());
        }

        proofs.push_back(std::move(proof));
    }
    return Ok(std::move(proofs));
}

Result<ProofList> parse_proofs(std::string_view text) {
    const json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return Err<ProofList>(ErrorCode::InvalidProof, "proof text is not valid JSON");
    }
    return proofs_from_json(document);
}

} // namespace bmt::file

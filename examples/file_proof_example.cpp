/**
 * @file file_proof_example.cpp
 * @brief Chunk a file, print its tree and prove one of its segments
 *
 * USAGE:
 *   file_proof_example [--file PATH] [--segment N] [--max-payload BYTES]
 *                      [--threads N] [--verbose]
 *
 * Without --file a generated payload of 128 full chunks plus a partial one is
 * used; with the default chunk size its last leaf becomes a carrier chunk.
 */

#include "bmt/chunk/chunk.hpp"
#include "bmt/file/inclusion_proof.hpp"
#include "bmt/file/proof_json.hpp"
#include "bmt/file/tree_builder.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<bmt::Bytes> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return bmt::Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bmt::Bytes sample_payload(std::size_t max_payload) {
    bmt::Bytes payload(128 * max_payload + 100);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>(i % 251);
    }
    return payload;
}

json tree_shape(const bmt::file::ChunkedFile& file) {
    json levels = json::array();
    for (std::size_t i = 0; i < file.bmt().size(); ++i) {
        json level = {
            {"level", i},
            {"chunks", file.bmt()[i].size()}
        };
        if (file.carriers()[i]) {
            level["carrier"] = bmt::to_hex(file.carriers()[i]->address());
        }
        levels.push_back(level);
    }
    return levels;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> input;
    std::size_t segment_index = 0;
    bmt::file::FileOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            input = fs::path(argv[++i]);
        } else if ((arg == "-s" || arg == "--segment") && i + 1 < argc) {
            segment_index = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "--max-payload" && i + 1 < argc) {
            options.chunk.max_payload_size = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            options.worker_threads = static_cast<std::size_t>(std::stoull(argv[++i]));
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::warn("Ignoring unknown argument {}", arg);
        }
    }

    if (auto valid = bmt::chunk::validate_options(options.chunk); valid.is_error()) {
        spdlog::error("Invalid options: {}", bmt::describe(valid.error()));
        return 1;
    }

    bmt::Bytes payload;
    if (input) {
        auto data = read_file(*input);
        if (!data) {
            spdlog::error("Cannot read {}", input->string());
            return 1;
        }
        payload = std::move(*data);
    } else {
        payload = sample_payload(options.chunk.max_payload_size);
    }
    spdlog::info("Chunking {} bytes with {}-byte chunks", payload.size(), options.chunk.max_payload_size);

    auto file = bmt::file::make_chunked_file(payload, options);
    if (file.is_error()) {
        spdlog::error("Chunking failed: {}", bmt::describe(file.error()));
        return 1;
    }

    spdlog::info("File address {}", bmt::to_hex(file.value().address()));
    spdlog::info("Span {} ({} leaf chunks)", file.value().span_value(), file.value().leaf_chunks().size());

    auto proof = bmt::file::file_inclusion_proof_bottom_up(file.value(), segment_index);
    if (proof.is_error()) {
        spdlog::error("Proof generation failed: {}", bmt::describe(proof.error()));
        return 1;
    }

    json report = {
        {"address", bmt::to_hex(file.value().address())},
        {"span", file.value().span_value()},
        {"levels", tree_shape(file.value())},
        {"segment_index", segment_index},
        {"proof", bmt::file::proofs_to_json(proof.value())}
    };
    std::cout << report.dump(2) << std::endl;

    // Round-trip through JSON before verifying, as a remote verifier would.
    auto decoded = bmt::file::parse_proofs(report["proof"].dump());
    if (decoded.is_error()) {
        spdlog::error("Proof decoding failed: {}", bmt::describe(decoded.error()));
        return 1;
    }

    const bmt::Segment segment = bmt::segment_at(payload, segment_index);
    auto address = bmt::file::file_address_from_inclusion_proof(decoded.value(), segment, segment_index,
                                                                options.chunk);
    if (address.is_error()) {
        spdlog::error("Proof verification failed: {}", bmt::describe(address.error()));
        return 1;
    }

    if (address.value() != file.value().address()) {
        spdlog::error("Proof resolves to {} instead of the file address", bmt::to_hex(address.value()));
        return 1;
    }
    spdlog::info("Segment {} verified against the file address", segment_index);
    return 0;
}

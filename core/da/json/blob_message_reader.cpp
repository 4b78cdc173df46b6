/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/json/blob_message_reader.hpp"

#include <limits>

#include "da/json/json_utils.hpp"
#include "utils/read_file.hpp"

namespace danode::da {

  namespace {
    constexpr uint64_t kMaxThreshold = std::numeric_limits<Threshold>::max();

    outcome::result<ErasureRoot> readErasureRoot(const rapidjson::Value &val) {
      ErasureRoot root;
      OUTCOME_TRY(chunk_length, json::getU64(val, "chunk_length"));
      OUTCOME_TRY(num_chunks, json::getU64(val, "num_chunks"));
      OUTCOME_TRY(hash, json::getBlob<common::Hash256::size()>(val, "root"));
      root.params.chunk_length = chunk_length;
      root.params.num_chunks = num_chunks;
      root.root = hash;
      return root;
    }

    outcome::result<QuorumHeader> readQuorumHeader(
        const rapidjson::Value &val) {
      QuorumHeader header;
      auto &param = header.security_param;
      OUTCOME_TRY(quorum_id,
                  json::getU64(
                      val, "quorum_id", std::numeric_limits<QuorumId>::max()));
      OUTCOME_TRY(adversary,
                  json::getU64(val, "adversary_threshold", kMaxThreshold));
      OUTCOME_TRY(quorum, json::getU64(val, "quorum_threshold", kMaxThreshold));
      OUTCOME_TRY(
          quantization_factor,
          json::getU64(val,
                       "quantization_factor",
                       std::numeric_limits<uint32_t>::max()));
      OUTCOME_TRY(encoded_blob_length,
                  json::getU64(val, "encoded_blob_length"));
      param.quorum_id = static_cast<QuorumId>(quorum_id);
      param.adversary_threshold = static_cast<Threshold>(adversary);
      param.quorum_threshold = static_cast<Threshold>(quorum);
      header.quantization_factor = static_cast<uint32_t>(quantization_factor);
      header.encoded_blob_length = encoded_blob_length;
      return header;
    }

    outcome::result<BlobHeader> readHeader(const rapidjson::Value &val) {
      BlobHeader header;
      auto &commitments = header.commitments;
      OUTCOME_TRY(commitment,
                  json::getBlob<Commitment::size()>(val, "commitment"));
      OUTCOME_TRY(length, json::getU64(val, "length"));
      commitments.commitment = commitment;
      commitments.length = length;

      OUTCOME_TRY(roots, json::getArray(val, "erasure_roots"));
      for (const auto &root : roots) {
        OUTCOME_TRY(erasure_root, readErasureRoot(root));
        commitments.erasure_roots.emplace_back(erasure_root);
      }

      OUTCOME_TRY(quorums, json::getArray(val, "quorums"));
      for (const auto &quorum : quorums) {
        OUTCOME_TRY(quorum_header, readQuorumHeader(quorum));
        header.quorum_infos.emplace_back(quorum_header);
      }
      return header;
    }

    outcome::result<Chunk> readChunk(const rapidjson::Value &val) {
      Chunk chunk;
      OUTCOME_TRY(coeffs, json::getArray(val, "coeffs"));
      chunk.coeffs.reserve(coeffs.Size());
      for (const auto &coeff : coeffs) {
        OUTCOME_TRY(symbol, json::parseBlob<kSymbolSize>(coeff));
        chunk.coeffs.emplace_back(symbol);
      }
      OUTCOME_TRY(proof, json::getArray(val, "proof"));
      chunk.proof.reserve(proof.Size());
      for (const auto &node : proof) {
        OUTCOME_TRY(hash, json::parseBlob<common::Hash256::size()>(node));
        chunk.proof.emplace_back(hash);
      }
      return chunk;
    }
  }  // namespace

  outcome::result<BlobMessage> parseBlobMessage(std::string_view text) {
    rapidjson::Document document;
    OUTCOME_TRY(json::parse(document, text));

    BlobMessage blob;
    OUTCOME_TRY(header, json::getMember(document, "header"));
    OUTCOME_TRY(blob_header, readHeader(*header));
    blob.header = std::move(blob_header);

    OUTCOME_TRY(bundles, json::getObject(document, "bundles"));
    for (const auto &bundle_entry : bundles) {
      std::string_view key{bundle_entry.name.GetString(),
                           bundle_entry.name.GetStringLength()};
      OUTCOME_TRY(quorum_id,
                  json::parseU64(key, std::numeric_limits<QuorumId>::max()));
      if (not bundle_entry.value.IsArray()) {
        return JsonError::WRONG_TYPE;
      }
      Bundle bundle;
      for (const auto &chunk_value : bundle_entry.value.GetArray()) {
        OUTCOME_TRY(chunk, readChunk(chunk_value));
        bundle.emplace_back(std::move(chunk));
      }
      auto [_, inserted] =
          blob.bundles.emplace(static_cast<QuorumId>(quorum_id),
                               std::move(bundle));
      if (not inserted) {
        return JsonError::DUPLICATE_ENTRY;
      }
    }
    return blob;
  }

  outcome::result<BlobMessage> loadBlobMessage(
      const std::filesystem::path &path) {
    OUTCOME_TRY(text, readText(path));
    return parseBlobMessage(text);
  }

}  // namespace danode::da

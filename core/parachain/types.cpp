/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/types.hpp"

namespace parasieve::parachain {

  namespace {
    constexpr size_t kCoreIndexBits = 8;
  }

  BackedCandidate BackedCandidate::from(
      CommittedCandidateReceipt candidate_,
      std::vector<ValidityAttestation> validity_votes_,
      scale::BitVec validator_indices_,
      std::optional<CoreIndex> core_index_) {
    BackedCandidate backed{
        .candidate = std::move(candidate_),
        .validity_votes = std::move(validity_votes_),
        .validator_indices = std::move(validator_indices_),
    };

    if (core_index_) {
      backed.injectCoreIndex(*core_index_);
    }

    return backed;
  }

  void BackedCandidate::injectCoreIndex(CoreIndex core_index) {
    auto val = uint8_t(core_index);
    for (size_t i = 0; i < kCoreIndexBits; ++i) {
      validator_indices.bits.push_back((val >> i) & 1);
    }
  }

  std::pair<std::vector<bool>, std::optional<CoreIndex>>
  BackedCandidate::validatorIndicesAndCoreIndex(bool core_index_enabled) const {
    const auto &bits = validator_indices.bits;
    if (core_index_enabled and bits.size() > kCoreIndexBits) {
      const auto offset = bits.size() - kCoreIndexBits;
      CoreIndex core_index = 0;
      for (size_t i = 0; i < kCoreIndexBits; ++i) {
        core_index |= CoreIndex(bits[offset + i]) << i;
      }
      return {std::vector<bool>(bits.begin(), bits.begin() + offset),
              core_index};
    }
    return {bits, std::nullopt};
  }

  void BackedCandidate::setValidatorIndicesAndCoreIndex(
      std::vector<bool> validator_indices_,
      std::optional<CoreIndex> core_index) {
    validator_indices.bits = std::move(validator_indices_);
    if (core_index) {
      injectCoreIndex(*core_index);
    }
  }

  CandidateHash candidateHash(const crypto::Hasher &hasher,
                              const CommittedCandidateReceipt &receipt) {
    return candidateHash(hasher, toPlain(hasher, receipt));
  }

  CandidateHash candidateHash(const crypto::Hasher &hasher,
                              const CandidateReceipt &receipt) {
    return hasher.blake2b_256(::scale::encode(receipt).value());
  }

  CandidateReceipt toPlain(const crypto::Hasher &hasher,
                           const CommittedCandidateReceipt &receipt) {
    return CandidateReceipt{
        .descriptor = receipt.descriptor,
        .commitments_hash =
            hasher.blake2b_256(::scale::encode(receipt.commitments).value()),
    };
  }

  Hash persistedValidationDataHash(const crypto::Hasher &hasher,
                                   const PersistedValidationData &pvd) {
    return hasher.blake2b_256(::scale::encode(pvd).value());
  }

}  // namespace parasieve::parachain

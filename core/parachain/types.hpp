/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/variant.hpp>
#include <scale/bitvec.hpp>
#include <scale/scale.hpp>
#include <scale/tie.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/unused.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_types.hpp"
#include "primitives/common.hpp"

namespace parasieve::parachain {

  using Hash = common::Hash256;
  using Signature = crypto::Sr25519Signature;
  using ParachainId = uint32_t;
  using PublicKey = crypto::Sr25519PublicKey;
  using CollatorPublicKey = PublicKey;
  using ValidatorIndex = uint32_t;
  using ValidatorId = crypto::Sr25519PublicKey;
  using UpwardMessage = common::Buffer;
  using ValidationCode = common::Buffer;
  using HeadData = common::Buffer;
  using CandidateHash = Hash;
  using CoreIndex = uint32_t;
  using GroupIndex = uint32_t;
  using ValidationCodeHash = Hash;
  using BlockNumber = primitives::BlockNumber;
  using SessionIndex = uint32_t;

  /// Signature with which parachain validators sign blocks.
  using ValidatorSignature = Signature;

  template <typename D>
  struct Indexed {
    using Type = std::decay_t<D>;
    SCALE_TIE(2);

    Type payload;
    ValidatorIndex ix;
  };

  template <typename T>
  using IndexedAndSigned = crypto::Sr25519Signed<Indexed<T>>;

  template <typename T>
  [[maybe_unused]] inline const T &getPayload(const IndexedAndSigned<T> &t) {
    return t.payload.payload;
  }

  template <typename T>
  [[maybe_unused]] inline T &getPayload(IndexedAndSigned<T> &t) {
    return t.payload.payload;
  }

  struct OutboundHorizontal {
    SCALE_TIE(2);

    ParachainId para_id;       /// Parachain Id is recepient id
    UpwardMessage upward_msg;  /// upward message for parallel parachain
  };

  struct CandidateCommitments {
    SCALE_TIE(6);

    std::vector<UpwardMessage> upward_msgs;  /// upward messages
    std::vector<OutboundHorizontal>
        outbound_hor_msgs;  /// outbound horizontal messages
    std::optional<ValidationCode>
        opt_para_runtime;         /// new parachain runtime if present
    HeadData para_head;           /// parachain head data
    uint32_t downward_msgs_count; /// number of downward messages that were
                                  /// processed by the parachain
    BlockNumber watermark;        /// watermark which specifies the relay chain
                                  /// block number up to which all inbound
                                  /// horizontal messages have been processed
  };

  /**
   * Unique descriptor of a candidate receipt.
   */
  struct CandidateDescriptor {
    SCALE_TIE(9);

    ParachainId para_id;  /// Parachain Id
    primitives::BlockHash
        relay_parent;  /// Hash of the relay chain block the candidate is
                       /// executed in the context of
    CollatorPublicKey collator_id;  /// Collators public key.
    primitives::BlockHash
        persisted_data_hash;         /// Hash of the persisted validation data
    primitives::BlockHash pov_hash;  /// Hash of the PoV block.
    Hash erasure_encoding_root;      /// Root of the block’s erasure encoding
                                     /// Merkle tree.
    Signature signature;  /// Collator signature of the concatenated components
    primitives::BlockHash
        para_head_hash;  /// Hash of the parachain head data of this candidate.
    ValidationCodeHash
        validation_code_hash;  /// Hash of the parachain Runtime.
  };

  struct CandidateReceipt {
    SCALE_TIE(2);

    CandidateDescriptor descriptor;  /// Candidate descriptor
    Hash commitments_hash;           /// Hash of candidate commitments
  };

  struct CommittedCandidateReceipt {
    SCALE_TIE(2);

    CandidateDescriptor descriptor;    /// Candidate descriptor
    CandidateCommitments commitments;  /// commitments retrieved from validation
                                       /// result and produced by the execution
                                       /// and validation parachain candidate
  };

  /// Implicit validity attestation by issuing.
  /// This corresponds to issuance of a `Candidate` statement.
  struct ImplicitValidityAttestation {
    SCALE_TIE(1);
    ValidatorSignature signature;
  };

  /// An explicit attestation. This corresponds to issuance of a
  /// `Valid` statement.
  struct ExplicitValidityAttestation {
    SCALE_TIE(1);
    ValidatorSignature signature;
  };

  /// An either implicit or explicit attestation to the validity of a parachain
  /// candidate.
  /// Note: order of types in variant matters
  using ValidityAttestation = boost::variant<Unused<0>,
                                             ImplicitValidityAttestation,   // 1
                                             ExplicitValidityAttestation>;  // 2

  /**
   * Candidate receipt with the votes of its backing group.
   *
   * When elastic scaling is in effect, the last 8 bits of `validator_indices`
   * carry the index of the core the candidate is backed on (LSB first).
   */
  struct BackedCandidate {
    SCALE_TIE(3);

    CommittedCandidateReceipt candidate;
    std::vector<ValidityAttestation> validity_votes;
    scale::BitVec validator_indices;

    /// Creates `BackedCandidate` from args.
    static BackedCandidate from(CommittedCandidateReceipt candidate_,
                                std::vector<ValidityAttestation>
                                    validity_votes_,
                                scale::BitVec validator_indices_,
                                std::optional<CoreIndex> core_index_);

    /// Appends the core index to the validator bitmap
    void injectCoreIndex(CoreIndex core_index);

    /// Splits the bitmap into validator indices and the injected core index.
    /// The core index is present only when `core_index_enabled` and the
    /// bitmap is longer than 8 bits.
    std::pair<std::vector<bool>, std::optional<CoreIndex>>
    validatorIndicesAndCoreIndex(bool core_index_enabled) const;

    /// Replaces the validator bitmap, re-injecting `core_index` if present
    void setValidatorIndicesAndCoreIndex(std::vector<bool> validator_indices_,
                                         std::optional<CoreIndex> core_index);

    const Hash &relayParent() const {
      return candidate.descriptor.relay_parent;
    }

    ParachainId paraId() const {
      return candidate.descriptor.para_id;
    }
  };

  /// Signed availability bitfield.
  using SignedBitfield = IndexedAndSigned<scale::BitVec>;

  /// Context of a validator signature: the session index and the relay parent
  class SigningContext {
   public:
    SCALE_TIE(2);

    /// Make signable message for payload.
    template <typename T>
    auto signable(const T &payload) const {
      return ::scale::encode(std::tie(payload, *this));
    }

    /// Current session index.
    SessionIndex session_index;
    /// Hash of the parent.
    primitives::BlockHash relay_parent;
  };

  /// The validation data which is persisted for the whole para chain
  /// execution.
  struct PersistedValidationData {
    SCALE_TIE(4);

    HeadData parent_head;
    BlockNumber relay_parent_number;
    Hash relay_parent_storage_root;
    uint32_t max_pov_size;
  };

  /// blake2b_256 of the receipt with its commitments replaced by their hash
  CandidateHash candidateHash(const crypto::Hasher &hasher,
                              const CommittedCandidateReceipt &receipt);

  CandidateHash candidateHash(const crypto::Hasher &hasher,
                              const CandidateReceipt &receipt);

  /// blake2b_256 of SCALE-encoded `PersistedValidationData`
  Hash persistedValidationDataHash(const crypto::Hasher &hasher,
                                   const PersistedValidationData &pvd);

  /// Receipt with the commitments replaced by their hash
  CandidateReceipt toPlain(const crypto::Hasher &hasher,
                           const CommittedCandidateReceipt &receipt);

  /// Number of votes required for a backing group of `group_len` members
  inline uint32_t effectiveMinimumBackingVotes(size_t group_len,
                                               uint32_t configured_minimum) {
    return std::min(static_cast<uint32_t>(group_len), configured_minimum);
  }

}  // namespace parasieve::parachain

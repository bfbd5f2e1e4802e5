/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>
#include <vector>

#include <boost/variant.hpp>
#include <scale/tie.hpp>

#include "common/empty.hpp"
#include "parachain/types.hpp"

namespace parasieve::dispute {

  using parachain::CandidateHash;
  using parachain::CandidateReceipt;
  using parachain::SessionIndex;
  using parachain::ValidatorIndex;
  using parachain::ValidatorSignature;
  using parachain::ValidityAttestation;

  // Different kinds of statements of validity/invalidity on a candidate.

  /// An explicit statement issued as part of a dispute.
  struct Explicit : Empty {};

  /// A seconded statement on a candidate from the backing phase.
  struct BackingSeconded {
    SCALE_TIE(1);
    /// Relay parent the candidate was seconded under
    parachain::Hash relay_parent;
  };

  /// A valid statement on a candidate from the backing phase.
  struct BackingValid {
    SCALE_TIE(1);
    /// Relay parent the candidate was backed under
    parachain::Hash relay_parent;
  };

  /// An approval vote from the approval checking phase.
  struct ApprovalChecking : Empty {};

  /// A valid statement, of the given kind
  using ValidDisputeStatement =
      boost::variant<Explicit, BackingSeconded, BackingValid, ApprovalChecking>;

  /// An invalid statement, of the given kind.
  using InvalidDisputeStatement = boost::variant<Explicit>;

  /// A statement about a candidate, to be used within some dispute resolution
  /// process.
  ///
  /// Statements are either in favor of the candidate's validity or against it.
  using DisputeStatement = boost::variant<ValidDisputeStatement,   // 0
                                          InvalidDisputeStatement  // 1
                                          >;

  /// A set of statements about a specific candidate.
  struct DisputeStatementSet {
    SCALE_TIE(3);

    /// The candidate referenced by this set.
    CandidateHash candidate_hash;

    /// The session index of the candidate.
    SessionIndex session;

    /// Statements about the candidate.
    std::vector<
        std::tuple<DisputeStatement, ValidatorIndex, ValidatorSignature>>
        statements;
  };

  /// A set of dispute statements.
  using MultiDisputeStatementSet = std::vector<DisputeStatementSet>;

  /// A dispute statement set which passed the on-chain validity checks
  struct CheckedDisputeStatementSet {
    DisputeStatementSet set;
  };

  using CheckedMultiDisputeStatementSet =
      std::vector<CheckedDisputeStatementSet>;

  /// Scraped runtime backing votes and resolved disputes.
  struct ScrapedOnChainVotes {
    SCALE_TIE(3);

    /// The session in which the block was included.
    SessionIndex session;

    /// Set of backing validators for each candidate, represented by its
    /// candidate receipt.
    std::vector<
        std::pair<CandidateReceipt,
                  std::vector<std::pair<ValidatorIndex, ValidityAttestation>>>>
        backing_validators_per_candidate;

    /// On-chain-recorded set of disputes.
    /// Note that the above `backing_validators` are
    /// unrelated to the backers of the disputes candidates.
    MultiDisputeStatementSet disputes;
  };

}  // namespace parasieve::dispute

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include "dispute_coordinator/types.hpp"
#include "log/logger.hpp"
#include "parachain/paras_inherent/weight_info.hpp"
#include "primitives/weight.hpp"

namespace parasieve::parachain {

  /// Validity check of a single dispute statement set
  using DisputeSetFilter =
      std::function<std::optional<dispute::CheckedDisputeStatementSet>(
          const dispute::DisputeStatementSet &)>;

  struct LimitedDisputes {
    dispute::CheckedMultiDisputeStatementSet checked;
    /// Weight charged for the disputes, see `limitAndSanitizeDisputes`
    primitives::Weight weight;
  };

  /**
   * Bounds the dispute statement sets of an inherent by weight and checks
   * each of them.
   */
  class DisputesLimiter {
   public:
    explicit DisputesLimiter(const WeightInfo &weight_info);

    /**
     * Removes sets repeating the (session, candidate) of an earlier set.
     * @return true if any set was removed
     */
    bool deduplicate(dispute::MultiDisputeStatementSet &disputes) const;

    /**
     * Deduplicates `disputes` and limits them to `max_consumable_weight`.
     * If all sets fit, every one passing `filter` is kept and the weight is
     * that of the kept sets. Otherwise sets are taken in order while they
     * fit, each one is charged even when `filter` rejects it, and sets that
     * would overflow are skipped.
     */
    LimitedDisputes limitAndSanitizeDisputes(
        dispute::MultiDisputeStatementSet disputes,
        const DisputeSetFilter &filter,
        const primitives::Weight &max_consumable_weight) const;

   private:
    const WeightInfo &weight_info_;
    log::Logger logger_;
  };

}  // namespace parasieve::parachain

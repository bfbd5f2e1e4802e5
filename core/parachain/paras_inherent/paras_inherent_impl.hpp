/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/paras_inherent/paras_inherent.hpp"

#include <memory>

#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "parachain/paras_inherent/bitfields_sanitizer.hpp"
#include "parachain/paras_inherent/candidates_sanitizer.hpp"
#include "parachain/paras_inherent/configuration.hpp"
#include "parachain/paras_inherent/disabled_validators_filter.hpp"
#include "parachain/paras_inherent/disputes_handler.hpp"
#include "parachain/paras_inherent/disputes_limiter.hpp"
#include "parachain/paras_inherent/inclusion.hpp"
#include "parachain/paras_inherent/scheduler.hpp"
#include "parachain/paras_inherent/shared.hpp"
#include "parachain/paras_inherent/weight_info.hpp"
#include "parachain/paras_inherent/weight_limit.hpp"

namespace parasieve::parachain {

  class ParasInherentImpl : public ParasInherent {
   public:
    ParasInherentImpl(
        std::shared_ptr<Configuration> configuration,
        std::shared_ptr<Scheduler> scheduler,
        std::shared_ptr<Inclusion> inclusion,
        std::shared_ptr<DisputesHandler> disputes_handler,
        std::shared_ptr<Shared> shared,
        std::shared_ptr<WeightInfo> weight_info,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    outcome::result<ProcessedInherent> processInherentData(
        ParachainInherentData data,
        ProcessInherentDataContext context,
        const BlockContext &block,
        ParasInherentState &state) override;

    std::optional<ParachainInherentData> createInherent(
        const primitives::InherentData &inherent_data,
        const BlockContext &block,
        ParasInherentState &state) override;

    outcome::result<primitives::Weight> enter(
        ParachainInherentData data,
        const BlockContext &block,
        ParasInherentState &state) override;

    outcome::result<void> onFinalize(ParasInherentState &state) override;

   private:
    /// Replaces the disputes of the on-chain votes
    static void setScrapableOnChainDisputes(
        ParasInherentState &state,
        SessionIndex session,
        const dispute::CheckedMultiDisputeStatementSet &checked);

    /// Replaces the backing votes of the on-chain votes
    static void setScrapableOnChainBackings(
        ParasInherentState &state,
        SessionIndex session,
        BackingValidatorsPerCandidate backings);

    std::shared_ptr<Configuration> configuration_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<Inclusion> inclusion_;
    std::shared_ptr<DisputesHandler> disputes_handler_;
    std::shared_ptr<Shared> shared_;
    std::shared_ptr<WeightInfo> weight_info_;
    std::shared_ptr<crypto::Hasher> hasher_;

    DisputesLimiter disputes_limiter_;
    BitfieldsSanitizer bitfields_sanitizer_;
    CandidatesSanitizer candidates_sanitizer_;
    DisabledValidatorsFilter disabled_validators_filter_;
    WeightLimiter weight_limiter_;

    log::Logger logger_;
  };

}  // namespace parasieve::parachain

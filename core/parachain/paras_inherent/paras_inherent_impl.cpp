/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/paras_inherent_impl.hpp"

#include <map>
#include <set>

#include <boost/assert.hpp>

#include "parachain/paras_inherent/paras_inherent_error.hpp"
#include "parachain/paras_inherent/weights.hpp"
#include "primitives/block_header.hpp"
#include "primitives/math.hpp"

namespace parasieve::parachain {

  ParasInherentImpl::ParasInherentImpl(
      std::shared_ptr<Configuration> configuration,
      std::shared_ptr<Scheduler> scheduler,
      std::shared_ptr<Inclusion> inclusion,
      std::shared_ptr<DisputesHandler> disputes_handler,
      std::shared_ptr<Shared> shared,
      std::shared_ptr<WeightInfo> weight_info,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : configuration_{std::move(configuration)},
        scheduler_{std::move(scheduler)},
        inclusion_{std::move(inclusion)},
        disputes_handler_{std::move(disputes_handler)},
        shared_{std::move(shared)},
        weight_info_{std::move(weight_info)},
        hasher_{std::move(hasher)},
        disputes_limiter_{*weight_info_},
        bitfields_sanitizer_{std::move(sr25519_provider)},
        candidates_sanitizer_{hasher_, inclusion_, scheduler_},
        disabled_validators_filter_{scheduler_},
        weight_limiter_{*weight_info_},
        logger_{log::createLogger("ParasInherent", "paras_inherent")} {
    BOOST_ASSERT(configuration_);
    BOOST_ASSERT(scheduler_);
    BOOST_ASSERT(inclusion_);
    BOOST_ASSERT(disputes_handler_);
    BOOST_ASSERT(shared_);
    BOOST_ASSERT(weight_info_);
    BOOST_ASSERT(hasher_);
  }

  outcome::result<ProcessedInherent> ParasInherentImpl::processInherentData(
      ParachainInherentData data,
      ProcessInherentDataContext context,
      const BlockContext &block,
      ParasInherentState &state) {
    auto &bitfields = data.bitfields;
    auto &backed_candidates = data.backed_candidates;

    SL_DEBUG(logger_,
             "Process inherent data: bitfields {}, backed candidates {}, "
             "disputes {}",
             bitfields.size(),
             backed_candidates.size(),
             data.disputes.size());

    if (primitives::calculateBlockHash(data.parent_header, *hasher_)
        != block.parent_hash) {
      return ParasInherentError::INVALID_PARENT_HEADER;
    }

    const auto config = configuration_->activeConfig();

    // before anything else
    shared_->addAllowedRelayParent(
        block.parent_hash,
        data.parent_header.state_root,
        math::sat_sub_unsigned<BlockNumber>(block.now, 1),
        config.allowed_ancestry_len);
    const auto &allowed_relay_parents = shared_->allowedRelayParents();

    const auto candidates_weight =
        backedCandidatesWeight(*weight_info_, backed_candidates);
    const auto bitfields_weight =
        signedBitfieldsWeight(*weight_info_, bitfields);
    const auto disputes_weight =
        multiDisputeStatementSetsWeight(*weight_info_, data.disputes);
    const auto all_weight_before =
        candidates_weight.saturatingAdd(bitfields_weight)
            .saturatingAdd(disputes_weight);
    SL_DEBUG(logger_,
             "Weight before filter: {}, candidates + bitfields: {}, "
             "disputes: {}",
             all_weight_before,
             candidates_weight.saturatingAdd(bitfields_weight),
             disputes_weight);

    const auto current_session = shared_->sessionIndex();
    const auto expected_bits = scheduler_->availabilityCores();
    const auto validators = shared_->activeValidatorKeys();

    const auto max_block_weight = maxBlockWeight(*configuration_);
    SL_DEBUG(logger_, "Used max block weight: {}", max_block_weight);

    crypto::RandChaCha20 rng{weight_limiter_.computeEntropy(
        block.parent_hash, block.parent_randomness)};

    const auto post_conclusion_acceptance_period =
        config.dispute_post_conclusion_acceptance_period;
    auto limited = disputes_limiter_.limitAndSanitizeDisputes(
        std::move(data.disputes),
        [&](const dispute::DisputeStatementSet &set) {
          return disputes_handler_->filterDisputeData(
              set, post_conclusion_acceptance_period);
        },
        max_block_weight);
    auto &checked_disputes = limited.checked;
    const auto checked_disputes_weight = limited.weight;

    primitives::Weight all_weight_after;
    if (context == ProcessInherentDataContext::PROVIDE_INHERENT) {
      // disputes are already limited, the rest is left to the others
      const auto non_disputes_weight = weight_limiter_.applyWeightLimit(
          backed_candidates,
          bitfields,
          max_block_weight.saturatingSub(checked_disputes_weight),
          rng);
      all_weight_after =
          non_disputes_weight.saturatingAdd(checked_disputes_weight);

      SL_DEBUG(logger_,
               "After filter: bitfields {}, backed candidates {}, checked "
               "disputes {}, weight {}",
               bitfields.size(),
               backed_candidates.size(),
               checked_disputes.size(),
               all_weight_after);
      if (all_weight_after.anyGt(max_block_weight)) {
        SL_WARN(logger_,
                "Post weight limiting weight is still too large: {}",
                all_weight_after);
      }
    } else {
      if (all_weight_before.anyGt(max_block_weight)) {
        SL_ERROR(logger_,
                 "Overweight para inherent data reached the runtime {}: {} > "
                 "{}",
                 block.parent_hash,
                 all_weight_before,
                 max_block_weight);
        return ParasInherentError::INHERENT_OVERWEIGHT;
      }
      all_weight_after = all_weight_before;
    }

    // import failures of individual disputes do not invalidate the block
    if (auto res =
            disputes_handler_->processCheckedMultiDisputeData(checked_disputes);
        res.has_error()) {
      SL_WARN(logger_,
              "Multi dispute data failed to update: {}",
              res.error().message());
    }
    setScrapableOnChainDisputes(state, current_session, checked_disputes);

    auto plainDisputes = [&] {
      dispute::MultiDisputeStatementSet disputes;
      disputes.reserve(checked_disputes.size());
      for (auto &checked : checked_disputes) {
        disputes.emplace_back(std::move(checked.set));
      }
      return disputes;
    };

    if (disputes_handler_->isFrozen()) {
      // the relay chain is invalid, no parachain blocks are included
      SL_DEBUG(logger_, "Relay chain is frozen, including disputes only");
      return ProcessedInherent{
          .data =
              ParachainInherentData{
                  .bitfields = {},
                  .backed_candidates = {},
                  .disputes = plainDisputes(),
                  .parent_header = std::move(data.parent_header),
              },
          .weight = checked_disputes_weight,
      };
    }

    // only disputes concluded just now in the current session may free
    // occupied cores
    std::set<CandidateHash> current_concluded_invalid;
    for (const auto &checked : checked_disputes) {
      const auto &set = checked.set;
      if (set.session == current_session
          and disputes_handler_->concludedInvalid(set.session,
                                                  set.candidate_hash)) {
        current_concluded_invalid.emplace(set.candidate_hash);
      }
    }

    std::vector<CoreIndex> freed_disputed;
    std::set<CandidateHash> concluded_invalid_hashes;
    for (const auto &[core, candidate_hash] :
         inclusion_->freeDisputed(current_concluded_invalid)) {
      freed_disputed.push_back(core);
      concluded_invalid_hashes.emplace(candidate_hash);
    }

    const auto disputed_bitfield =
        createDisputedBitfield(expected_bits, freed_disputed);

    auto checked_bitfields = bitfields_sanitizer_.sanitize(
        std::move(bitfields),
        disputed_bitfield,
        expected_bits,
        SigningContext{
            .session_index = current_session,
            .relay_parent = block.parent_hash,
        },
        validators);

    const auto freed_concluded =
        inclusion_->updatePendingAvailabilityAndGetFreedCores(
            validators, checked_bitfields);
    for (const auto &[_, candidate_hash] : freed_concluded) {
      disputes_handler_->noteIncluded(
          current_session, candidate_hash, block.now);
    }

    std::vector<CoreIndex> freed_timeout;
    if (scheduler_->availabilityTimeoutCheckRequired()) {
      freed_timeout = inclusion_->freeTimedout();
    }
    if (not freed_timeout.empty()) {
      SL_DEBUG(logger_, "Evicted {} timed out cores", freed_timeout.size());
    }

    // later reasons override earlier ones for the same core
    std::map<CoreIndex, FreedReason> freed;
    for (const auto &entry : freed_concluded) {
      freed.insert_or_assign(entry.first, FreedReason::CONCLUDED);
    }
    for (auto core : freed_disputed) {
      freed.insert_or_assign(core, FreedReason::CONCLUDED);
    }
    for (auto core : freed_timeout) {
      freed.insert_or_assign(core, FreedReason::TIMED_OUT);
    }
    scheduler_->freeCoresAndFillClaimQueue(freed, block.now);

    const auto core_index_enabled = config.elastic_scaling_enabled;

    ScheduledCores scheduled;
    size_t total_scheduled_cores = 0;
    for (const auto &[core, para_id] : scheduler_->scheduledParas()) {
      ++total_scheduled_cores;
      scheduled[para_id].emplace(core);
    }

    const auto initial_candidate_count = backed_candidates.size();
    auto candidates_with_core =
        candidates_sanitizer_.sanitize(std::move(backed_candidates),
                                       allowed_relay_parents,
                                       concluded_invalid_hashes,
                                       std::move(scheduled),
                                       config);
    disabled_validators_filter_.filter(candidates_with_core,
                                       shared_->disabledValidators(),
                                       allowed_relay_parents,
                                       core_index_enabled,
                                       config.minimum_backing_votes);
    const auto count = countCandidates(candidates_with_core);

    if (count > total_scheduled_cores) {
      return ParasInherentError::UNSCHEDULED_CANDIDATE;
    }

    // everything has been filtered during the construction already
    if (context == ProcessInherentDataContext::ENTER
        and initial_candidate_count != count) {
      return ParasInherentError::CANDIDATES_FILTERED_DURING_EXECUTION;
    }

    OUTCOME_TRY(processed,
                inclusion_->processCandidates(
                    allowed_relay_parents, candidates_with_core,
                    core_index_enabled));
    scheduler_->occupied(processed.core_indices);

    setScrapableOnChainBackings(
        state,
        current_session,
        std::move(processed.candidate_receipt_with_backing_validator_indices));

    std::vector<BackedCandidate> included_candidates;
    included_candidates.reserve(count);
    for (auto &[_, candidates] : candidates_with_core) {
      for (auto &candidate : candidates) {
        included_candidates.emplace_back(std::move(candidate.first));
      }
    }

    return ProcessedInherent{
        .data =
            ParachainInherentData{
                .bitfields = std::move(checked_bitfields),
                .backed_candidates = std::move(included_candidates),
                .disputes = plainDisputes(),
                .parent_header = std::move(data.parent_header),
            },
        .weight = all_weight_after,
    };
  }

  std::optional<ParachainInherentData> ParasInherentImpl::createInherent(
      const primitives::InherentData &inherent_data,
      const BlockContext &block,
      ParasInherentState &state) {
    auto data = inherent_data.getData<ParachainInherentData>(
        kParachainsInherentIdentifier);
    if (data.has_error()) {
      if (data.error()
          != primitives::InherentDataError::IDENTIFIER_DOES_NOT_EXIST) {
        SL_WARN(logger_,
                "Parachains inherent data failed to decode: {}",
                data.error().message());
      }
      return std::nullopt;
    }

    auto processed =
        processInherentData(std::move(data.value()),
                            ProcessInherentDataContext::PROVIDE_INHERENT,
                            block,
                            state);
    if (processed.has_error()) {
      SL_WARN(logger_,
              "Processing inherent data failed: {}",
              processed.error().message());
      return std::nullopt;
    }
    return std::move(processed.value().data);
  }

  outcome::result<primitives::Weight> ParasInherentImpl::enter(
      ParachainInherentData data,
      const BlockContext &block,
      ParasInherentState &state) {
    if (state.included) {
      return ParasInherentError::TOO_MANY_INCLUSION_INHERENTS;
    }
    state.included = true;

    OUTCOME_TRY(processed,
                processInherentData(std::move(data),
                                    ProcessInherentDataContext::ENTER,
                                    block,
                                    state));
    return processed.weight;
  }

  outcome::result<void> ParasInherentImpl::onFinalize(
      ParasInherentState &state) {
    if (not state.included) {
      return ParasInherentError::INHERENT_NOT_INCLUDED;
    }
    state.included = false;
    return outcome::success();
  }

  void ParasInherentImpl::setScrapableOnChainDisputes(
      ParasInherentState &state,
      SessionIndex session,
      const dispute::CheckedMultiDisputeStatementSet &checked) {
    dispute::ScrapedOnChainVotes votes{
        .session = session,
        .backing_validators_per_candidate = {},
        .disputes = {},
    };
    if (state.on_chain_votes) {
      votes.backing_validators_per_candidate =
          std::move(state.on_chain_votes->backing_validators_per_candidate);
    }
    for (const auto &set : checked) {
      votes.disputes.emplace_back(set.set);
    }
    state.on_chain_votes = std::move(votes);
  }

  void ParasInherentImpl::setScrapableOnChainBackings(
      ParasInherentState &state,
      SessionIndex session,
      BackingValidatorsPerCandidate backings) {
    dispute::ScrapedOnChainVotes votes{
        .session = session,
        .backing_validators_per_candidate = std::move(backings),
        .disputes = {},
    };
    if (state.on_chain_votes) {
      votes.disputes = std::move(state.on_chain_votes->disputes);
    }
    state.on_chain_votes = std::move(votes);
  }

}  // namespace parasieve::parachain

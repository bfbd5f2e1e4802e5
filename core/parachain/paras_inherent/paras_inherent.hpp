/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "dispute_coordinator/types.hpp"
#include "outcome/outcome.hpp"
#include "parachain/parachain_inherent_data.hpp"
#include "primitives/common.hpp"
#include "primitives/inherent_data.hpp"
#include "primitives/weight.hpp"

namespace parasieve::parachain {

  enum class ProcessInherentDataContext {
    /// Construction of the inherent by the block author, the data is reduced
    /// to fit the block
    PROVIDE_INHERENT,
    /// Execution of a block, the data must already fit
    ENTER,
  };

  /// The block being built or executed
  struct BlockContext {
    BlockNumber now = 0;
    primitives::BlockHash parent_hash;
    /// Randomness of the parent block, if any
    std::optional<common::Hash256> parent_randomness;
  };

  /// State of the inherent kept between calls within a block
  struct ParasInherentState {
    /// The inherent was entered in the current block
    bool included = false;
    /// Backing votes and disputes of the last processed inherent
    std::optional<dispute::ScrapedOnChainVotes> on_chain_votes;
  };

  struct ProcessedInherent {
    ParachainInherentData data;
    primitives::Weight weight;
  };

  /**
   * Admission of availability bitfields, backed candidates and disputes into
   * a relay chain block.
   */
  class ParasInherent {
   public:
    virtual ~ParasInherent() = default;

    /**
     * Sanitizes `data` and applies it to the parachain modules.
     * In `PROVIDE_INHERENT` context whatever doesn't fit the block or is
     * invalid is dropped. In `ENTER` context the data must pass unchanged.
     * @return the data that was applied and its weight
     */
    virtual outcome::result<ProcessedInherent> processInherentData(
        ParachainInherentData data,
        ProcessInherentDataContext context,
        const BlockContext &block,
        ParasInherentState &state) = 0;

    /**
     * Builds the inherent of a new block from the data supplied under
     * `kParachainsInherentIdentifier`.
     * @return nullopt if there is no data or it can't be processed
     */
    virtual std::optional<ParachainInherentData> createInherent(
        const primitives::InherentData &inherent_data,
        const BlockContext &block,
        ParasInherentState &state) = 0;

    /**
     * Executes the inherent of a block, at most once per block.
     * @return the weight consumed
     */
    virtual outcome::result<primitives::Weight> enter(
        ParachainInherentData data,
        const BlockContext &block,
        ParasInherentState &state) = 0;

    /// Fails if the inherent was not entered in the block being finalized
    virtual outcome::result<void> onFinalize(ParasInherentState &state) = 0;
  };

}  // namespace parasieve::parachain

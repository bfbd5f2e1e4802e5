/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace parasieve::parachain {

  enum class ParasInherentError {
    /// Inclusion inherent called more than once per block
    TOO_MANY_INCLUSION_INHERENTS = 1,
    /// The hash of the submitted parent header doesn't correspond to the
    /// saved block hash of the parent
    INVALID_PARENT_HEADER,
    /// The data given to the inherent will result in an overweight block
    INHERENT_OVERWEIGHT,
    /// A candidate was filtered during inherent execution. This should have
    /// only been done during creation
    CANDIDATES_FILTERED_DURING_EXECUTION,
    /// Too many candidates supplied
    UNSCHEDULED_CANDIDATE,
    /// The block was finalized without the inherent
    INHERENT_NOT_INCLUDED,
  };

}  // namespace parasieve::parachain

OUTCOME_HPP_DECLARE_ERROR(parasieve::parachain, ParasInherentError)

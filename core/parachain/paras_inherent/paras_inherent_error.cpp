/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/paras_inherent_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(parasieve::parachain, ParasInherentError, e) {
  using E = parasieve::parachain::ParasInherentError;
  switch (e) {
    case E::TOO_MANY_INCLUSION_INHERENTS:
      return "Inclusion inherent called more than once per block";
    case E::INVALID_PARENT_HEADER:
      return "The hash of the submitted parent header doesn't correspond to "
             "the saved block hash of the parent";
    case E::INHERENT_OVERWEIGHT:
      return "The data given to the inherent will result in an overweight "
             "block";
    case E::CANDIDATES_FILTERED_DURING_EXECUTION:
      return "A candidate was filtered during inherent execution";
    case E::UNSCHEDULED_CANDIDATE:
      return "Too many candidates supplied";
    case E::INHERENT_NOT_INCLUDED:
      return "Bitfields and heads must be included every block";
  }
  return "Unknown ParasInherentError";
}

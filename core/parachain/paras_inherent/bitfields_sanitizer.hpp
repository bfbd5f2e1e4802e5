/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <scale/bitvec.hpp>

#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "parachain/types.hpp"

namespace parasieve::parachain {

  /// Bit per availability core, set for cores freed by a concluded dispute
  using DisputedBitfield = scale::BitVec;

  /**
   * Filters availability bitfields down to the well-formed, correctly signed
   * ones in strictly increasing validator order.
   */
  class BitfieldsSanitizer {
   public:
    explicit BitfieldsSanitizer(
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    /**
     * Drops bitfields which
     *  - are not `expected_bits` long,
     *  - vote for a core in `disputed`,
     *  - are not ordered by strictly increasing validator index,
     *  - have a validator index outside of `validators`,
     *  - are not signed by their validator under `signing_context`.
     * Returns nothing at all if `disputed` is not `expected_bits` long.
     */
    std::vector<SignedBitfield> sanitize(
        std::vector<SignedBitfield> unchecked,
        const DisputedBitfield &disputed,
        size_t expected_bits,
        const SigningContext &signing_context,
        const std::vector<ValidatorId> &validators) const;

   private:
    bool verify(const SignedBitfield &bitfield,
                const SigningContext &signing_context,
                const ValidatorId &validator) const;

    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    log::Logger logger_;
  };

}  // namespace parasieve::parachain

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}
#include <scale/tie.hpp>

#include "common/blob.hpp"

namespace parasieve::crypto {
  namespace constants::sr25519 {
    /**
     * Important constants to deal with sr25519
     */
    enum {
      PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
      SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
    };
  }  // namespace constants::sr25519
}  // namespace parasieve::crypto

PARASIEVE_BLOB_STRICT_TYPEDEF(parasieve::crypto,
                              Sr25519PublicKey,
                              constants::sr25519::PUBLIC_SIZE);
PARASIEVE_BLOB_STRICT_TYPEDEF(parasieve::crypto,
                              Sr25519Signature,
                              constants::sr25519::SIGNATURE_SIZE);

namespace parasieve::crypto {
  template <typename D>
  struct Sr25519Signed {
    using Type = std::decay_t<D>;
    SCALE_TIE(2);

    Type payload;
    Sr25519Signature signature;
  };
}  // namespace parasieve::crypto

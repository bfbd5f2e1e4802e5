/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <openssl/digest.h>

namespace parasieve::crypto {

  common::Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    common::Hash256 out;
    unsigned int out_size = out.size();
    EVP_Digest(data.data(),
               data.size(),
               out.data(),
               &out_size,
               EVP_blake2b256(),
               nullptr);
    return out;
  }

}  // namespace parasieve::crypto

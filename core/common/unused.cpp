/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/unused.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(parasieve, UnusedError, e) {
  using E = parasieve::UnusedError;
  switch (e) {
    case E::AttemptToEncodeUnused:
      return "Attempt to encode a value that must be unused";
    case E::AttemptToDecodeUnused:
      return "Attempt to decode a value that must be unused";
  }
  return "Unknown UnusedError";
}

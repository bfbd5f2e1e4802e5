/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/paras_inherent/configuration.hpp"

#include <gmock/gmock.h>

namespace parasieve::parachain {

  class ConfigurationMock : public Configuration {
   public:
    MOCK_METHOD(HostConfiguration, activeConfig, (), (const, override));

    MOCK_METHOD(BlockWeights, blockWeights, (), (const, override));

    MOCK_METHOD(BlockLength, blockLength, (), (const, override));
  };

}  // namespace parasieve::parachain

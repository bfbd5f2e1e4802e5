/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/paras_inherent/scheduler.hpp"

#include <gmock/gmock.h>

namespace parasieve::parachain {

  class SchedulerMock : public Scheduler {
   public:
    MOCK_METHOD(size_t, availabilityCores, (), (const, override));

    using ScheduledParas = std::vector<std::pair<CoreIndex, ParachainId>>;
    MOCK_METHOD(ScheduledParas, scheduledParas, (), (const, override));

    using FreedCores = std::map<CoreIndex, FreedReason>;
    MOCK_METHOD(void,
                freeCoresAndFillClaimQueue,
                (const FreedCores &, BlockNumber),
                (override));

    MOCK_METHOD(bool, availabilityTimeoutCheckRequired, (), (const, override));

    MOCK_METHOD(std::optional<GroupIndex>,
                groupAssignedToCore,
                (CoreIndex, BlockNumber),
                (const, override));

    MOCK_METHOD(std::optional<std::vector<ValidatorIndex>>,
                groupValidators,
                (GroupIndex),
                (const, override));

    MOCK_METHOD(void, occupied, (const ScheduledParas &), (override));
  };

}  // namespace parasieve::parachain

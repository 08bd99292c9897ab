/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/validator/statement_distribution/session_topology.hpp"

#include <gmock/gmock.h>

namespace attesta::parachain::statement_distribution {
  class SessionTopologyMock : public ISessionTopology {
   public:
    MOCK_METHOD(std::optional<ValidatorIndex>,
                validator_index_for_peer,
                (const PeerId &),
                (const, override));

    MOCK_METHOD(bool,
                is_grid_eligible,
                (const PeerId &, GroupIndex),
                (const, override));
  };
}  // namespace attesta::parachain::statement_distribution

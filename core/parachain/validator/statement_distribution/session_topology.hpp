/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  /// Session topology as computed by the grid and authority discovery.
  class ISessionTopology {
   public:
    virtual ~ISessionTopology() = default;

    /// Validator index the peer authenticated as in the current session.
    virtual std::optional<ValidatorIndex> validator_index_for_peer(
        const PeerId &peer) const = 0;

    /// Whether grid rules allow sending statements of `group` to `peer`.
    virtual bool is_grid_eligible(const PeerId &peer,
                                  GroupIndex group) const = 0;
  };

}  // namespace attesta::parachain::statement_distribution

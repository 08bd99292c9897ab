/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/peer_eligibility.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace attesta::parachain::statement_distribution {

  ClusterEligibility::ClusterEligibility(
      std::shared_ptr<ISessionTopology> topology)
      : topology_{std::move(topology)} {
    BOOST_ASSERT(topology_);
  }

  bool ClusterEligibility::accepts(
      const PeerId &peer,
      GroupIndex,
      std::span<const ValidatorIndex> group_validators) const {
    auto validator = topology_->validator_index_for_peer(peer);
    if (not validator) {
      return false;
    }
    return std::find(group_validators.begin(), group_validators.end(),
                     *validator)
        != group_validators.end();
  }

  GridEligibility::GridEligibility(std::shared_ptr<ISessionTopology> topology)
      : topology_{std::move(topology)} {
    BOOST_ASSERT(topology_);
  }

  bool GridEligibility::accepts(const PeerId &peer,
                                GroupIndex group_index,
                                std::span<const ValidatorIndex>) const {
    return topology_->is_grid_eligible(peer, group_index);
  }

  EligibilityChecks defaultEligibilityChecks(
      std::shared_ptr<ISessionTopology> topology) {
    return {
        std::make_shared<ClusterEligibility>(topology),
        std::make_shared<GridEligibility>(topology),
    };
  }

  bool isEligible(const EligibilityChecks &checks,
                  const PeerId &peer,
                  GroupIndex group_index,
                  std::span<const ValidatorIndex> group_validators) {
    return std::any_of(checks.begin(), checks.end(), [&](const auto &check) {
      return check->accepts(peer, group_index, group_validators);
    });
  }

}  // namespace attesta::parachain::statement_distribution

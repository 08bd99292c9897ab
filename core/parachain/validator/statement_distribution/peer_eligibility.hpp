/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <span>
#include <vector>

#include "parachain/validator/statement_distribution/session_topology.hpp"
#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  /// One rule deciding whether statements of a group may be sent to a peer.
  class PeerEligibilityCheck {
   public:
    virtual ~PeerEligibilityCheck() = default;

    virtual bool accepts(
        const PeerId &peer,
        GroupIndex group_index,
        std::span<const ValidatorIndex> group_validators) const = 0;
  };

  /// Accepts peers that are validators of the candidate's group.
  class ClusterEligibility : public PeerEligibilityCheck {
   public:
    explicit ClusterEligibility(std::shared_ptr<ISessionTopology> topology);

    bool accepts(
        const PeerId &peer,
        GroupIndex group_index,
        std::span<const ValidatorIndex> group_validators) const override;

   private:
    std::shared_ptr<ISessionTopology> topology_;
  };

  /// Accepts peers the grid topology routes the group's statements to.
  class GridEligibility : public PeerEligibilityCheck {
   public:
    explicit GridEligibility(std::shared_ptr<ISessionTopology> topology);

    bool accepts(
        const PeerId &peer,
        GroupIndex group_index,
        std::span<const ValidatorIndex> group_validators) const override;

   private:
    std::shared_ptr<ISessionTopology> topology_;
  };

  /// Checks tried in order until one accepts.
  using EligibilityChecks = std::vector<std::shared_ptr<PeerEligibilityCheck>>;

  /// Cluster rules first, then grid.
  EligibilityChecks defaultEligibilityChecks(
      std::shared_ptr<ISessionTopology> topology);

  bool isEligible(const EligibilityChecks &checks,
                  const PeerId &peer,
                  GroupIndex group_index,
                  std::span<const ValidatorIndex> group_validators);

}  // namespace attesta::parachain::statement_distribution

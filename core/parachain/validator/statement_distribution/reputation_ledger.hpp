/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_map>

#include "log/logger.hpp"
#include "network/reputation_change.hpp"
#include "parachain/validator/network_bridge.hpp"
#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  /// Reputation change applied for each event kind.
  class ReputationTable {
   public:
    /// Table filled with the network-wide default magnitudes.
    ReputationTable();

    const network::ReputationChange &get(ReputationEvent event) const;

    /// Overrides the magnitude of one event, reason stays the same.
    void set_value(ReputationEvent event, network::Reputation value);

    bool operator==(const ReputationTable &other) const = default;

   private:
    std::unordered_map<ReputationEvent, network::ReputationChange> changes_;
  };

  /**
   * Turns reputation events into peer reports. Each call emits exactly one
   * report, repeated misbehavior is never folded.
   */
  class ReputationLedger {
   public:
    ReputationLedger(ReputationTable table,
                     std::shared_ptr<NetworkBridge> network_bridge);

    void report(const PeerId &peer, ReputationEvent event) const;

    const ReputationTable &table() const {
      return table_;
    }

   private:
    ReputationTable table_;
    std::shared_ptr<NetworkBridge> network_bridge_;
    log::Logger logger_ = log::createLogger("ReputationLedger", "reputation");
  };

}  // namespace attesta::parachain::statement_distribution

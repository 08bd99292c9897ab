/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "log/logger.hpp"
#include "network/i_peer_view.hpp"
#include "parachain/validator/network_bridge.hpp"
#include "parachain/validator/statement_distribution/knowledge_store.hpp"
#include "parachain/validator/statement_distribution/peer_eligibility.hpp"

namespace attesta::parachain::statement_distribution {

  /**
   * Pushes newly accepted statements of one relay parent to the peers that
   * have it in view, do not know the statement yet and are eligible by
   * cluster or grid rules.
   */
  class Rebroadcaster {
   public:
    Rebroadcaster(RelayHash relay_parent,
                  std::shared_ptr<network::IPeerView> peer_view,
                  std::shared_ptr<NetworkBridge> network_bridge,
                  EligibilityChecks eligibility_checks);

    /// Sends `statement` and marks the recipients as knowing it.
    /// @return recipients in the order they were sent to
    std::vector<PeerId> forward(KnowledgeStore &knowledge,
                                const CandidateHash &candidate_hash,
                                const SignedCompactStatement &statement);

   private:
    RelayHash relay_parent_;
    std::shared_ptr<network::IPeerView> peer_view_;
    std::shared_ptr<NetworkBridge> network_bridge_;
    EligibilityChecks eligibility_checks_;
    log::Logger logger_ =
        log::createLogger("Rebroadcaster", "statement_distribution");
  };

}  // namespace attesta::parachain::statement_distribution

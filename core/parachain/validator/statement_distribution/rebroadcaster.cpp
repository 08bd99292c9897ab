/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/rebroadcaster.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace attesta::parachain::statement_distribution {

  Rebroadcaster::Rebroadcaster(RelayHash relay_parent,
                               std::shared_ptr<network::IPeerView> peer_view,
                               std::shared_ptr<NetworkBridge> network_bridge,
                               EligibilityChecks eligibility_checks)
      : relay_parent_{relay_parent},
        peer_view_{std::move(peer_view)},
        network_bridge_{std::move(network_bridge)},
        eligibility_checks_{std::move(eligibility_checks)} {
    BOOST_ASSERT(peer_view_);
    BOOST_ASSERT(network_bridge_);
  }

  std::vector<PeerId> Rebroadcaster::forward(
      KnowledgeStore &knowledge,
      const CandidateHash &candidate_hash,
      const SignedCompactStatement &statement) {
    std::vector<PeerId> recipients;
    const auto kind = network::vstaging::statementKind(getPayload(statement));
    const auto group_index = knowledge.group_index(candidate_hash);
    const auto group_validators = knowledge.group_validators(candidate_hash);
    if (not kind or not group_index or not group_validators) {
      return recipients;
    }
    const auto originator = statement.payload.ix;

    for (auto &peer : peer_view_->peersWithRelayParent(relay_parent_)) {
      if (knowledge.is_known_by_peer(peer, candidate_hash, originator, *kind)) {
        continue;
      }
      if (not isEligible(
              eligibility_checks_, peer, *group_index, *group_validators)) {
        continue;
      }
      recipients.emplace_back(std::move(peer));
    }
    if (recipients.empty()) {
      return recipients;
    }
    std::sort(recipients.begin(), recipients.end());

    SL_TRACE(logger_,
             "Forward statement of validator {} for candidate {} to {} peers",
             originator,
             candidate_hash,
             recipients.size());
    network_bridge_->send_validation_message(
        recipients,
        network::vstaging::StatementDistributionMessageStatement{
            .relay_parent = relay_parent_,
            .compact = statement,
        });
    for (const auto &peer : recipients) {
      if (auto res =
              knowledge.record_peer(peer, candidate_hash, originator, *kind);
          res.has_error()) {
        SL_WARN(logger_,
                "Can't mark statement as sent to peer {}: {}",
                peer,
                res.error());
      }
    }
    return recipients;
  }

}  // namespace attesta::parachain::statement_distribution

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/reputation_ledger.hpp"

#include <boost/assert.hpp>

namespace attesta::parachain::statement_distribution {
  namespace cost = network::reputation::cost;
  namespace benefit = network::reputation::benefit;

  ReputationTable::ReputationTable()
      : changes_{
          {ReputationEvent::kFirstValidStatement,
           benefit::VALID_STATEMENT_FIRST},
          {ReputationEvent::kValidStatement, benefit::VALID_STATEMENT},
          {ReputationEvent::kValidResponse, benefit::VALID_RESPONSE},
          {ReputationEvent::kUnrequestedResponseStatement,
           cost::UNREQUESTED_RESPONSE_STATEMENT},
          {ReputationEvent::kDuplicateStatement, cost::DUPLICATE_STATEMENT},
          {ReputationEvent::kInvalidSignature, cost::INVALID_SIGNATURE},
          {ReputationEvent::kBadDataProvider, cost::BAD_DATA_PROVIDER},
          {ReputationEvent::kMalformedResponse,
           cost::IMPROPERLY_DECODED_RESPONSE},
          {ReputationEvent::kUnexpectedStatement, cost::UNEXPECTED_STATEMENT},
          {ReputationEvent::kUnexpectedRequest, cost::UNEXPECTED_REQUEST},
          {ReputationEvent::kMalformedManifest, cost::MALFORMED_MANIFEST},
          {ReputationEvent::kWithheldStatements, cost::WITHHELD_STATEMENTS},
      } {}

  const network::ReputationChange &ReputationTable::get(
      ReputationEvent event) const {
    auto it = changes_.find(event);
    BOOST_ASSERT(it != changes_.end());
    return it->second;
  }

  void ReputationTable::set_value(ReputationEvent event,
                                  network::Reputation value) {
    auto &change = changes_.at(event);
    change.value = value;
  }

  ReputationLedger::ReputationLedger(
      ReputationTable table, std::shared_ptr<NetworkBridge> network_bridge)
      : table_{std::move(table)}, network_bridge_{std::move(network_bridge)} {
    BOOST_ASSERT(network_bridge_);
  }

  void ReputationLedger::report(const PeerId &peer,
                                ReputationEvent event) const {
    const auto &change = table_.get(event);
    SL_TRACE(logger_,
             "Report peer {}: {} ({}, {})",
             peer,
             toString(event),
             change.value,
             change.reason);
    network_bridge_->report_peer(peer, change);
  }

}  // namespace attesta::parachain::statement_distribution

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/request_scheduler.hpp"

#include <boost/assert.hpp>

namespace attesta::parachain::statement_distribution {

  RequestScheduler::RequestScheduler(
      RelayHash relay_parent,
      RequestPolicy policy,
      std::shared_ptr<network::IPeerView> peer_view,
      std::shared_ptr<NetworkBridge> network_bridge)
      : relay_parent_{relay_parent},
        policy_{policy},
        peer_view_{std::move(peer_view)},
        network_bridge_{std::move(network_bridge)} {
    BOOST_ASSERT(peer_view_);
    BOOST_ASSERT(network_bridge_);
  }

  outcome::result<void> RequestScheduler::maybe_request(
      const KnowledgeStore &knowledge,
      const CandidateHash &candidate_hash,
      const PeerId &peer,
      RequestReason reason,
      Clock::time_point now,
      ResponseHandler handler,
      uint32_t attempt) {
    if (not knowledge.has_candidate(candidate_hash)) {
      return StatementDistributionError::UNKNOWN_CANDIDATE;
    }
    if (knowledge.knowledge_state(candidate_hash)
        == CandidateKnowledgeState::kFullyKnown) {
      return StatementDistributionError::KNOWLEDGE_COMPLETE;
    }
    RequestKey key{peer, candidate_hash};
    if (outstanding_.contains(key)) {
      return StatementDistributionError::REQUEST_ALREADY_OUTSTANDING;
    }
    if (not peer_view_->peerHasRelayParent(peer, relay_parent_)) {
      return StatementDistributionError::PEER_NOT_IN_VIEW;
    }

    OUTCOME_TRY(mask, knowledge.mask_for(candidate_hash));
    network::vstaging::AttestedCandidateRequest request{
        .candidate_hash = candidate_hash,
        .mask = mask,
    };
    const auto id = next_request_id_++;
    outstanding_.emplace(key,
                         OutstandingRequest{
                             .id = id,
                             .peer = peer,
                             .candidate_hash = candidate_hash,
                             .mask = std::move(mask),
                             .deadline = now + policy_.request_timeout,
                             .reason = reason,
                             .attempt = attempt,
                         });

    SL_DEBUG(logger_,
             "Request {} for candidate {} to peer {} (relay parent {}, "
             "attempt {})",
             id,
             candidate_hash,
             peer,
             relay_parent_,
             attempt);
    auto sent = network_bridge_->send_attested_candidate_request(
        peer,
        request,
        IfDisconnected::kImmediateError,
        [id, handler{std::move(handler)}](
            outcome::result<common::Buffer> response) mutable {
          handler(id, std::move(response));
        });
    if (sent.has_error()) {
      SL_WARN(logger_,
              "Sending request for candidate {} to peer {} failed: {}",
              candidate_hash,
              peer,
              sent.error());
      outstanding_.erase(key);
      return sent.as_failure();
    }
    return outcome::success();
  }

  bool RequestScheduler::is_outstanding(
      const PeerId &peer, const CandidateHash &candidate_hash) const {
    return outstanding_.contains(RequestKey{peer, candidate_hash});
  }

  std::optional<OutstandingRequest> RequestScheduler::take(
      const PeerId &peer, const CandidateHash &candidate_hash, RequestId id) {
    auto it = outstanding_.find(RequestKey{peer, candidate_hash});
    if (it == outstanding_.end() or it->second.id != id) {
      return std::nullopt;
    }
    auto request = std::move(it->second);
    outstanding_.erase(it);
    return request;
  }

  RetryDecision RequestScheduler::decide_retry(
      const OutstandingRequest &request) const {
    using Action = RetryDecision::Action;
    auto action = Action::kGiveUp;
    if (request.attempt < policy_.max_request_retries) {
      action = policy_.retry_with_other_peer ? Action::kRetryOtherPeer
                                             : Action::kRetrySamePeer;
    }
    return RetryDecision{
        .action = action,
        .peer = request.peer,
        .candidate_hash = request.candidate_hash,
        .reason = request.reason,
        .next_attempt = request.attempt + 1,
    };
  }

  std::optional<RetryDecision> RequestScheduler::on_timeout(
      const PeerId &peer, const CandidateHash &candidate_hash) {
    auto it = outstanding_.find(RequestKey{peer, candidate_hash});
    if (it == outstanding_.end()) {
      return std::nullopt;
    }
    auto request = std::move(it->second);
    outstanding_.erase(it);
    SL_DEBUG(logger_,
             "Request {} for candidate {} to peer {} timed out (attempt {})",
             request.id,
             candidate_hash,
             peer,
             request.attempt);
    return decide_retry(request);
  }

  std::vector<std::pair<PeerId, CandidateHash>> RequestScheduler::expire(
      Clock::time_point now) const {
    std::vector<std::pair<PeerId, CandidateHash>> expired;
    for (const auto &[key, request] : outstanding_) {
      if (request.deadline <= now) {
        expired.emplace_back(key);
      }
    }
    return expired;
  }

  void RequestScheduler::cancel_all() {
    if (not outstanding_.empty()) {
      SL_DEBUG(logger_,
               "Cancel {} outstanding requests at relay parent {}",
               outstanding_.size(),
               relay_parent_);
    }
    outstanding_.clear();
  }

}  // namespace attesta::parachain::statement_distribution

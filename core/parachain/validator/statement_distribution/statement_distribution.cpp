/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/statement_distribution.hpp"

#include <algorithm>
#include <string>

#include <boost/assert.hpp>

#include "utils/weak_io_context_post.hpp"

namespace attesta::parachain::statement_distribution {

  StatementDistribution::StatementDistribution(
      WeakIoContext main_context,
      application::StatementDistributionConfig config,
      std::shared_ptr<network::IPeerView> peer_view,
      std::shared_ptr<ISessionTopology> session_topology,
      std::shared_ptr<IHypotheticalMembership> hypothetical_membership,
      std::shared_ptr<NetworkBridge> network_bridge,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : main_context_{std::move(main_context)},
        config_{std::move(config)},
        peer_view_{std::move(peer_view)},
        session_topology_{std::move(session_topology)},
        hypothetical_membership_{std::move(hypothetical_membership)},
        network_bridge_{std::move(network_bridge)},
        hasher_{std::move(hasher)},
        ledger_{config_.reputation, network_bridge_},
        response_validator_{
            hasher_, std::move(sr25519_provider), config_.validationPolicy()},
        eligibility_checks_{defaultEligibilityChecks(session_topology_)} {
    BOOST_ASSERT(peer_view_);
    BOOST_ASSERT(session_topology_);
    BOOST_ASSERT(hypothetical_membership_);
    BOOST_ASSERT(network_bridge_);
    BOOST_ASSERT(hasher_);
  }

  void StatementDistribution::activate_relay_parent(
      RelayParentContext context) {
    REINVOKE(main_context_, activate_relay_parent, std::move(context));

    const auto relay_parent = context.relay_parent;
    if (per_relay_parent_.contains(relay_parent)) {
      SL_TRACE(logger_, "Relay parent {} is already active", relay_parent);
      return;
    }
    SL_DEBUG(logger_,
             "Activate relay parent {} (session {}, {} groups, validator {})",
             relay_parent,
             context.session_index,
             context.groups.groups.size(),
             context.local_validator ? std::to_string(*context.local_validator)
                                     : std::string{"none"});

    SigningContext signing_context{
        .session_index = context.session_index,
        .relay_parent = relay_parent,
    };
    per_relay_parent_.emplace(
        relay_parent,
        PerRelayParentState{
            .context = std::move(context),
            .signing_context = signing_context,
            .knowledge = {},
            .scheduler = RequestScheduler{relay_parent,
                                          config_.requestPolicy(),
                                          peer_view_,
                                          network_bridge_},
            .rebroadcaster = Rebroadcaster{relay_parent,
                                           peer_view_,
                                           network_bridge_,
                                           eligibility_checks_},
            .pending_confirmations = {},
        });
  }

  void StatementDistribution::prune_relay_parent(
      const RelayHash &relay_parent) {
    REINVOKE(main_context_, prune_relay_parent, relay_parent);

    auto it = per_relay_parent_.find(relay_parent);
    if (it == per_relay_parent_.end()) {
      return;
    }
    SL_DEBUG(logger_, "Prune relay parent {}", relay_parent);
    it->second.scheduler.cancel_all();
    per_relay_parent_.erase(it);
  }

  StatementDistribution::PerRelayParentState *
  StatementDistribution::find_state(const RelayHash &relay_parent) {
    auto it = per_relay_parent_.find(relay_parent);
    if (it == per_relay_parent_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  bool StatementDistribution::note_candidate(
      PerRelayParentState &state,
      const CandidateHash &candidate_hash,
      GroupIndex group_index) {
    auto &knowledge = state.knowledge;
    if (auto known_group = knowledge.group_index(candidate_hash)) {
      return *known_group == group_index;
    }
    auto validators = state.context.groups.get(group_index);
    if (not validators) {
      return false;
    }
    knowledge.note_candidate(
        candidate_hash,
        group_index,
        std::vector<ValidatorIndex>(validators->begin(), validators->end()));

    if (auto it = state.pending_confirmations.find(candidate_hash);
        it != state.pending_confirmations.end()) {
      knowledge.confirm(candidate_hash,
                        std::move(it->second.receipt),
                        std::move(it->second.persisted_validation_data));
      state.pending_confirmations.erase(it);
    }
    return true;
  }

  bool StatementDistribution::may_propagate(
      const PerRelayParentState &state,
      const CandidateHash &candidate_hash) const {
    const auto membership = hypothetical_membership_->check(
        state.context.relay_parent, candidate_hash);
    if (membership == HypotheticalMembership::kNotMember) {
      SL_DEBUG(logger_,
               "Candidate {} is not a member of any fragment tree, "
               "statements are not propagated",
               candidate_hash);
      return false;
    }
    return true;
  }

  RequestScheduler::ResponseHandler StatementDistribution::response_handler(
      const RelayHash &relay_parent,
      const PeerId &peer,
      const CandidateHash &candidate_hash) {
    return [weak{weak_from_this()}, relay_parent, peer, candidate_hash](
               RequestId request_id,
               outcome::result<common::Buffer> response) mutable {
      if (auto self = weak.lock()) {
        self->handle_response(relay_parent,
                              peer,
                              candidate_hash,
                              request_id,
                              std::move(response));
      }
    };
  }

  void StatementDistribution::request(PerRelayParentState &state,
                                      const CandidateHash &candidate_hash,
                                      const PeerId &peer,
                                      RequestReason reason,
                                      uint32_t attempt) {
    auto res = state.scheduler.maybe_request(
        state.knowledge,
        candidate_hash,
        peer,
        reason,
        Clock::now(),
        response_handler(state.context.relay_parent, peer, candidate_hash),
        attempt);
    if (res.has_error()) {
      SL_TRACE(logger_,
               "No request for candidate {} to peer {}: {}",
               candidate_hash,
               peer,
               res.error());
    }
  }

  void StatementDistribution::retry(PerRelayParentState &state,
                                    const RetryDecision &decision) {
    using Action = RetryDecision::Action;
    switch (decision.action) {
      case Action::kGiveUp:
        SL_DEBUG(logger_,
                 "Give up requesting candidate {} after {} attempts",
                 decision.candidate_hash,
                 decision.next_attempt);
        return;
      case Action::kRetrySamePeer:
        request(state,
                decision.candidate_hash,
                decision.peer,
                decision.reason,
                decision.next_attempt);
        return;
      case Action::kRetryOtherPeer:
        break;
    }

    auto peers = peer_view_->peersWithRelayParent(state.context.relay_parent);
    std::sort(peers.begin(), peers.end());
    for (const auto &peer : peers) {
      if (peer == decision.peer
          or state.scheduler.is_outstanding(peer, decision.candidate_hash)) {
        continue;
      }
      request(state,
              decision.candidate_hash,
              peer,
              decision.reason,
              decision.next_attempt);
      if (state.scheduler.is_outstanding(peer, decision.candidate_hash)) {
        return;
      }
    }
    SL_DEBUG(logger_,
             "No other peer to request candidate {} from",
             decision.candidate_hash);
  }

  void StatementDistribution::handle_incoming_statement(
      const PeerId &peer,
      const RelayHash &relay_parent,
      const SignedCompactStatement &statement) {
    REINVOKE(main_context_, handle_incoming_statement, peer, relay_parent,
             statement);

    auto state = find_state(relay_parent);
    if (state == nullptr) {
      SL_TRACE(logger_,
               "Statement from peer {} for unknown relay parent {}",
               peer,
               relay_parent);
      return;
    }

    const auto &compact = getPayload(statement);
    const auto originator = statement.payload.ix;
    const auto kind = network::vstaging::statementKind(compact);
    const auto candidate_hash = network::vstaging::candidateHash(compact);
    const auto group_index =
        state->context.groups.byValidatorIndex(originator);
    if (not kind or not candidate_hash or not group_index
        or not note_candidate(*state, *candidate_hash, *group_index)) {
      SL_TRACE(logger_,
               "Unexpected statement of validator {} from peer {}",
               originator,
               peer);
      ledger_.report(peer, ReputationEvent::kUnexpectedStatement);
      return;
    }
    auto &knowledge = state->knowledge;

    if (state->context.local_validator == originator
        and not knowledge.is_known_locally(
            *candidate_hash, originator, *kind)) {
      SL_TRACE(logger_,
               "Peer {} sent statement in the name of the local validator",
               peer);
      ledger_.report(peer, ReputationEvent::kUnexpectedStatement);
      return;
    }

    if (not response_validator_.check_signature(
            statement,
            state->signing_context,
            state->context.validator_keys)) {
      ledger_.report(peer, ReputationEvent::kInvalidSignature);
      return;
    }

    if (knowledge.was_received_from(peer, *candidate_hash, originator, *kind)) {
      ledger_.report(peer, ReputationEvent::kDuplicateStatement);
      return;
    }

    if (auto res = knowledge.record_received(
            peer, *candidate_hash, originator, *kind);
        res.has_error()) {
      SL_WARN(logger_, "Can't record statement from {}: {}", peer, res.error());
      return;
    }
    auto fresh = knowledge.store_statement(*candidate_hash, statement);
    if (fresh.has_error()) {
      SL_WARN(logger_, "Can't store statement from {}: {}", peer, fresh.error());
      return;
    }
    ledger_.report(peer,
                   fresh.value() ? ReputationEvent::kFirstValidStatement
                                 : ReputationEvent::kValidStatement);

    if (not may_propagate(*state, *candidate_hash)) {
      return;
    }
    if (fresh.value()) {
      state->rebroadcaster.forward(knowledge, *candidate_hash, statement);
    }
    request(*state, *candidate_hash, peer, RequestReason::kGapFill);
  }

  void StatementDistribution::handle_incoming_manifest(
      const PeerId &peer,
      const network::vstaging::BackedCandidateManifest &manifest) {
    REINVOKE(main_context_, handle_incoming_manifest, peer, manifest);

    auto state = find_state(manifest.relay_parent);
    if (state == nullptr) {
      SL_TRACE(logger_,
               "Manifest from peer {} for unknown relay parent {}",
               peer,
               manifest.relay_parent);
      return;
    }

    auto group = state->context.groups.get(manifest.group_index);
    if (not group or not manifest.statement_knowledge.has_len(group->size())
        or not note_candidate(
            *state, manifest.candidate_hash, manifest.group_index)) {
      SL_TRACE(logger_,
               "Malformed manifest from peer {} for candidate {}",
               peer,
               manifest.candidate_hash);
      ledger_.report(peer, ReputationEvent::kMalformedManifest);
      return;
    }

    auto &knowledge = state->knowledge;
    if (auto res = knowledge.record_received_filter(
            peer, manifest.candidate_hash, manifest.statement_knowledge);
        res.has_error()) {
      SL_WARN(logger_,
              "Can't record manifest knowledge of peer {}: {}",
              peer,
              res.error());
      return;
    }

    auto local = knowledge.mask_for(manifest.candidate_hash);
    if (local.has_error()
        or not local.value().lacks_any_of(manifest.statement_knowledge)) {
      return;
    }
    if (not may_propagate(*state, manifest.candidate_hash)) {
      return;
    }
    request(*state,
            manifest.candidate_hash,
            peer,
            RequestReason::kManifestCatchUp);
  }

  void StatementDistribution::handle_response(
      const RelayHash &relay_parent,
      const PeerId &peer,
      const CandidateHash &candidate_hash,
      RequestId request_id,
      outcome::result<common::Buffer> response) {
    REINVOKE(main_context_,
             handle_response,
             relay_parent,
             peer,
             candidate_hash,
             request_id,
             std::move(response));

    auto state = find_state(relay_parent);
    if (state == nullptr) {
      SL_TRACE(logger_,
               "Drop response of peer {} for pruned relay parent {}",
               peer,
               relay_parent);
      return;
    }
    auto request = state->scheduler.take(peer, candidate_hash, request_id);
    if (not request) {
      SL_TRACE(logger_,
               "Drop response {} of peer {} for candidate {} without request",
               request_id,
               peer,
               candidate_hash);
      return;
    }

    if (response.has_error()) {
      SL_DEBUG(logger_,
               "Request for candidate {} to peer {} failed: {}",
               candidate_hash,
               peer,
               response.error());
      retry(*state, state->scheduler.decide_retry(*request));
      return;
    }

    auto result =
        response_validator_.validate(peer,
                                     *request,
                                     state->signing_context,
                                     state->context.validator_keys,
                                     response.value(),
                                     state->knowledge);
    for (const auto event : result.events) {
      ledger_.report(peer, event);
    }
    if (not result.confirmed) {
      return;
    }
    state->knowledge.confirm(
        candidate_hash,
        std::move(result.confirmed->receipt),
        std::move(result.confirmed->persisted_validation_data));

    if (not result.accepted.empty() and may_propagate(*state, candidate_hash)) {
      for (const auto &statement : result.accepted) {
        state->rebroadcaster.forward(
            state->knowledge, candidate_hash, statement);
      }
    }
    check_withheld(*state, peer, *request);
  }

  void StatementDistribution::check_withheld(
      PerRelayParentState &state,
      const PeerId &peer,
      const OutstandingRequest &request) {
    if (not state.knowledge.lacks_claimed_by(peer, request.candidate_hash)) {
      return;
    }
    SL_DEBUG(logger_,
             "Peer {} withheld advertised statements of candidate {}",
             peer,
             request.candidate_hash);
    if (config_.punish_withheld_statements) {
      ledger_.report(peer, ReputationEvent::kWithheldStatements);
    }
    retry(state, state.scheduler.decide_retry(request));
  }

  void StatementDistribution::handle_request_timeout(
      const PeerId &peer, const CandidateHash &candidate_hash) {
    REINVOKE(main_context_, handle_request_timeout, peer, candidate_hash);

    for (auto &[relay_parent, state] : per_relay_parent_) {
      if (auto decision = state.scheduler.on_timeout(peer, candidate_hash)) {
        retry(state, *decision);
      }
    }
  }

  void StatementDistribution::check_timeouts(Clock::time_point now) {
    REINVOKE(main_context_, check_timeouts, now);

    for (auto &[relay_parent, state] : per_relay_parent_) {
      for (const auto &[peer, candidate_hash] : state.scheduler.expire(now)) {
        if (auto decision = state.scheduler.on_timeout(peer, candidate_hash)) {
          retry(state, *decision);
        }
      }
    }
  }

  outcome::result<network::vstaging::AttestedCandidateResponse>
  StatementDistribution::handle_incoming_request(
      const PeerId &peer,
      const network::vstaging::AttestedCandidateRequest &request) {
    auto it = std::find_if(
        per_relay_parent_.begin(),
        per_relay_parent_.end(),
        [&](const auto &entry) {
          return entry.second.knowledge.has_candidate(request.candidate_hash);
        });
    if (it == per_relay_parent_.end()) {
      ledger_.report(peer, ReputationEvent::kUnexpectedRequest);
      return StatementDistributionError::UNKNOWN_CANDIDATE;
    }
    auto &knowledge = it->second.knowledge;

    auto confirmed = knowledge.confirmed(request.candidate_hash);
    if (not confirmed) {
      ledger_.report(peer, ReputationEvent::kUnexpectedRequest);
      return StatementDistributionError::CANDIDATE_NOT_CONFIRMED;
    }
    auto group = knowledge.group_validators(request.candidate_hash);
    BOOST_ASSERT(group);
    if (not request.mask.has_len(group->size())) {
      ledger_.report(peer, ReputationEvent::kUnexpectedRequest);
      return StatementDistributionError::INVALID_MASK_LENGTH;
    }

    network::vstaging::AttestedCandidateResponse response{
        .candidate_receipt = confirmed->get().receipt,
        .persisted_validation_data =
            confirmed->get().persisted_validation_data,
        .statements =
            knowledge.statements_for(request.candidate_hash, request.mask),
    };
    for (const auto &statement : response.statements) {
      auto kind = network::vstaging::statementKind(getPayload(statement));
      BOOST_ASSERT(kind);
      OUTCOME_TRY(knowledge.record_peer(
          peer, request.candidate_hash, statement.payload.ix, *kind));
    }
    SL_DEBUG(logger_,
             "Serve candidate {} to peer {} with {} statements",
             request.candidate_hash,
             peer,
             response.statements.size());
    return response;
  }

  outcome::result<void> StatementDistribution::share_local_statement(
      const RelayHash &relay_parent, const SignedCompactStatement &statement) {
    auto state = find_state(relay_parent);
    if (state == nullptr) {
      return StatementDistributionError::UNKNOWN_RELAY_PARENT;
    }
    const auto &compact = getPayload(statement);
    const auto candidate_hash = network::vstaging::candidateHash(compact);
    const auto group_index =
        state->context.groups.byValidatorIndex(statement.payload.ix);
    if (not candidate_hash or not group_index
        or not note_candidate(*state, *candidate_hash, *group_index)) {
      return KnowledgeStoreError::VALIDATOR_NOT_IN_GROUP;
    }

    OUTCOME_TRY(fresh,
                state->knowledge.store_statement(*candidate_hash, statement));
    if (fresh and may_propagate(*state, *candidate_hash)) {
      state->rebroadcaster.forward(
          state->knowledge, *candidate_hash, statement);
    }
    return outcome::success();
  }

  void StatementDistribution::note_candidate_confirmed(
      const RelayHash &relay_parent,
      const network::CommittedCandidateReceipt &receipt,
      const runtime::PersistedValidationData &persisted_validation_data) {
    REINVOKE(main_context_,
             note_candidate_confirmed,
             relay_parent,
             receipt,
             persisted_validation_data);

    auto state = find_state(relay_parent);
    if (state == nullptr) {
      return;
    }
    const auto candidate_hash = network::candidateHash(*hasher_, receipt);
    SL_TRACE(logger_, "Candidate {} confirmed", candidate_hash);
    if (state->knowledge.has_candidate(candidate_hash)) {
      state->knowledge.confirm(
          candidate_hash, receipt, persisted_validation_data);
      return;
    }
    state->pending_confirmations.try_emplace(
        candidate_hash,
        ConfirmedCandidate{
            .receipt = receipt,
            .persisted_validation_data = persisted_validation_data,
        });
  }

  CandidateKnowledgeState StatementDistribution::candidate_state(
      const RelayHash &relay_parent,
      const CandidateHash &candidate_hash) const {
    auto it = per_relay_parent_.find(relay_parent);
    if (it == per_relay_parent_.end()) {
      return CandidateKnowledgeState::kUnknown;
    }
    return it->second.knowledge.knowledge_state(candidate_hash);
  }

}  // namespace attesta::parachain::statement_distribution

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "application/statement_distribution_config.hpp"
#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "network/i_peer_view.hpp"
#include "network/types/collator_messages_vstaging.hpp"
#include "parachain/groups.hpp"
#include "parachain/validator/network_bridge.hpp"
#include "parachain/validator/signing_context.hpp"
#include "parachain/validator/statement_distribution/hypothetical_membership.hpp"
#include "parachain/validator/statement_distribution/knowledge_store.hpp"
#include "parachain/validator/statement_distribution/peer_eligibility.hpp"
#include "parachain/validator/statement_distribution/rebroadcaster.hpp"
#include "parachain/validator/statement_distribution/reputation_ledger.hpp"
#include "parachain/validator/statement_distribution/request_scheduler.hpp"
#include "parachain/validator/statement_distribution/response_validator.hpp"
#include "parachain/validator/statement_distribution/session_topology.hpp"
#include "utils/weak_io_context.hpp"

namespace attesta::parachain::statement_distribution {

  /// Session data of a freshly activated relay parent.
  struct RelayParentContext {
    RelayHash relay_parent;
    SessionIndex session_index;
    /// Public keys of the session's validators, by validator index.
    std::vector<ValidatorId> validator_keys;
    Groups groups;
    /// Our index if the local node validates in this session.
    std::optional<ValidatorIndex> local_validator;
  };

  /**
   * Statement distribution for all active relay parents.
   *
   * Receives gossip statements and manifests, fills knowledge gaps with
   * attested candidate requests, validates responses, serves requests of
   * other nodes and rebroadcasts accepted statements. All state of a relay
   * parent lives in one entry that is erased when it is pruned.
   *
   * Entry points returning nothing re-post themselves to the main context.
   * The others must be called on it.
   */
  class StatementDistribution
      : public std::enable_shared_from_this<StatementDistribution> {
   public:
    StatementDistribution(
        WeakIoContext main_context,
        application::StatementDistributionConfig config,
        std::shared_ptr<network::IPeerView> peer_view,
        std::shared_ptr<ISessionTopology> session_topology,
        std::shared_ptr<IHypotheticalMembership> hypothetical_membership,
        std::shared_ptr<NetworkBridge> network_bridge,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    void activate_relay_parent(RelayParentContext context);

    /// Cancels outstanding requests and drops all state of `relay_parent`.
    void prune_relay_parent(const RelayHash &relay_parent);

    /// Statement gossiped to us directly.
    void handle_incoming_statement(const PeerId &peer,
                                   const RelayHash &relay_parent,
                                   const SignedCompactStatement &statement);

    void handle_incoming_manifest(
        const PeerId &peer,
        const network::vstaging::BackedCandidateManifest &manifest);

    /// Response to request `request_id`, or the error it failed with.
    void handle_response(const RelayHash &relay_parent,
                         const PeerId &peer,
                         const CandidateHash &candidate_hash,
                         RequestId request_id,
                         outcome::result<common::Buffer> response);

    void handle_request_timeout(const PeerId &peer,
                                const CandidateHash &candidate_hash);

    /// Times out every request whose deadline is not after `now`.
    void check_timeouts(Clock::time_point now);

    /// Serves attested candidate request of another node.
    outcome::result<network::vstaging::AttestedCandidateResponse>
    handle_incoming_request(
        const PeerId &peer,
        const network::vstaging::AttestedCandidateRequest &request);

    /// Records statement signed by the local validator and sends it out.
    outcome::result<void> share_local_statement(
        const RelayHash &relay_parent, const SignedCompactStatement &statement);

    /// Candidate receipt and validation data became known by backing.
    void note_candidate_confirmed(
        const RelayHash &relay_parent,
        const network::CommittedCandidateReceipt &receipt,
        const runtime::PersistedValidationData &persisted_validation_data);

    CandidateKnowledgeState candidate_state(
        const RelayHash &relay_parent,
        const CandidateHash &candidate_hash) const;

   private:
    struct PerRelayParentState {
      RelayParentContext context;
      SigningContext signing_context;
      KnowledgeStore knowledge;
      RequestScheduler scheduler;
      Rebroadcaster rebroadcaster;
      /// Confirmations for candidates we have no group for yet.
      std::unordered_map<CandidateHash, ConfirmedCandidate>
          pending_confirmations;
    };

    PerRelayParentState *find_state(const RelayHash &relay_parent);

    /// Registers candidate with group of `group_index`.
    /// @return false if the candidate is known with another group
    bool note_candidate(PerRelayParentState &state,
                        const CandidateHash &candidate_hash,
                        GroupIndex group_index);

    /// Whether statements of candidate may be propagated.
    bool may_propagate(const PerRelayParentState &state,
                       const CandidateHash &candidate_hash) const;

    void request(PerRelayParentState &state,
                 const CandidateHash &candidate_hash,
                 const PeerId &peer,
                 RequestReason reason,
                 uint32_t attempt = 0);

    void retry(PerRelayParentState &state, const RetryDecision &decision);

    /// Retries the request if `peer` still holds statements it advertised.
    void check_withheld(PerRelayParentState &state,
                        const PeerId &peer,
                        const OutstandingRequest &request);

    RequestScheduler::ResponseHandler response_handler(
        const RelayHash &relay_parent,
        const PeerId &peer,
        const CandidateHash &candidate_hash);

    WeakIoContext main_context_;
    application::StatementDistributionConfig config_;
    std::shared_ptr<network::IPeerView> peer_view_;
    std::shared_ptr<ISessionTopology> session_topology_;
    std::shared_ptr<IHypotheticalMembership> hypothetical_membership_;
    std::shared_ptr<NetworkBridge> network_bridge_;
    std::shared_ptr<crypto::Hasher> hasher_;
    ReputationLedger ledger_;
    ResponseValidator response_validator_;
    EligibilityChecks eligibility_checks_;

    std::unordered_map<RelayHash, PerRelayParentState> per_relay_parent_;

    log::Logger logger_ =
        log::createLogger("StatementDistribution", "statement_distribution");
  };

}  // namespace attesta::parachain::statement_distribution

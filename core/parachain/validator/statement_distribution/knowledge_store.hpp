/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "network/types/collator_messages_vstaging.hpp"
#include "outcome/outcome.hpp"
#include "parachain/validator/statement_distribution/statement_distribution_error.hpp"
#include "parachain/validator/statement_distribution/types.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace attesta::parachain::statement_distribution {

  /// Receipt and validation data of a candidate whose content is known.
  struct ConfirmedCandidate {
    network::CommittedCandidateReceipt receipt;
    runtime::PersistedValidationData persisted_validation_data;
  };

  /// What we know about a peer's knowledge of one candidate.
  struct PeerKnowledge {
    /// Statements we sent to the peer.
    StatementFilter sent;
    /// Statements the peer sent to us or claimed in a manifest.
    StatementFilter received;
  };

  /**
   * Per relay parent record of which (validator, kind) statements of each
   * candidate are known locally and which are known to each peer.
   *
   * Bits are indexed by the position of the validator in the candidate's
   * backing group. Nothing is ever removed; the store is dropped as a whole
   * when its relay parent is pruned.
   */
  class KnowledgeStore {
   public:
    /// Registers candidate backed by `group`. Repeated calls keep the first
    /// registration.
    void note_candidate(const CandidateHash &candidate_hash,
                        GroupIndex group_index,
                        std::vector<ValidatorIndex> group_validators);

    bool has_candidate(const CandidateHash &candidate_hash) const;

    std::optional<GroupIndex> group_index(
        const CandidateHash &candidate_hash) const;

    std::optional<std::span<const ValidatorIndex>> group_validators(
        const CandidateHash &candidate_hash) const;

    /// Position of `validator` within the candidate's group.
    std::optional<size_t> position_in_group(const CandidateHash &candidate_hash,
                                            ValidatorIndex validator) const;

    /// Marks statement as known locally. Idempotent.
    outcome::result<void> record_local(const CandidateHash &candidate_hash,
                                       ValidatorIndex validator,
                                       StatementKind kind);

    /// Marks statement as known to `peer` because we sent it. Idempotent.
    outcome::result<void> record_peer(const PeerId &peer,
                                      const CandidateHash &candidate_hash,
                                      ValidatorIndex validator,
                                      StatementKind kind);

    /// Marks statement as received from `peer`. Implies `record_peer`.
    outcome::result<void> record_received(const PeerId &peer,
                                          const CandidateHash &candidate_hash,
                                          ValidatorIndex validator,
                                          StatementKind kind);

    /// Records every bit set in `filter` as received from `peer`.
    outcome::result<void> record_received_filter(
        const PeerId &peer,
        const CandidateHash &candidate_hash,
        const StatementFilter &filter);

    /// Snapshot of the local knowledge.
    outcome::result<StatementFilter> mask_for(
        const CandidateHash &candidate_hash) const;

    bool is_known_locally(const CandidateHash &candidate_hash,
                          ValidatorIndex validator,
                          StatementKind kind) const;

    bool is_known_by_peer(const PeerId &peer,
                          const CandidateHash &candidate_hash,
                          ValidatorIndex validator,
                          StatementKind kind) const;

    /// Whether `peer` sent or advertised a statement which is not known
    /// locally.
    bool lacks_claimed_by(const PeerId &peer,
                          const CandidateHash &candidate_hash) const;

    bool was_received_from(const PeerId &peer,
                           const CandidateHash &candidate_hash,
                           ValidatorIndex validator,
                           StatementKind kind) const;

    /// Records statement locally and keeps the signed form for serving
    /// requests. Returns true when the statement was not known before.
    outcome::result<bool> store_statement(
        const CandidateHash &candidate_hash,
        const SignedCompactStatement &statement);

    CandidateKnowledgeState knowledge_state(
        const CandidateHash &candidate_hash) const;

    void confirm(const CandidateHash &candidate_hash,
                 network::CommittedCandidateReceipt receipt,
                 runtime::PersistedValidationData persisted_validation_data);

    std::optional<std::reference_wrapper<const ConfirmedCandidate>> confirmed(
        const CandidateHash &candidate_hash) const;

    /// Stored statements whose bit is unset in `unwanted`, `Seconded` first,
    /// each kind in arrival order.
    std::vector<SignedCompactStatement> statements_for(
        const CandidateHash &candidate_hash,
        const StatementFilter &unwanted) const;

   private:
    struct CandidateEntry {
      GroupIndex group_index;
      std::vector<ValidatorIndex> validators;
      StatementFilter local;
      std::vector<SignedCompactStatement> statements;
      std::unordered_map<PeerId, PeerKnowledge> peers;
      std::optional<ConfirmedCandidate> confirmed;
    };

    /// Entry and validator position, or the reason the pair is unknown.
    outcome::result<std::pair<CandidateEntry *, size_t>> locate(
        const CandidateHash &candidate_hash, ValidatorIndex validator);

    const PeerKnowledge *find_peer(const PeerId &peer,
                                   const CandidateHash &candidate_hash) const;

    std::unordered_map<CandidateHash, CandidateEntry> candidates_;
  };

}  // namespace attesta::parachain::statement_distribution

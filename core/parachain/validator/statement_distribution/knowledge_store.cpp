/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/knowledge_store.hpp"

#include <algorithm>

namespace attesta::parachain::statement_distribution {

  void KnowledgeStore::note_candidate(
      const CandidateHash &candidate_hash,
      GroupIndex group_index,
      std::vector<ValidatorIndex> group_validators) {
    if (candidates_.contains(candidate_hash)) {
      return;
    }
    const auto group_size = group_validators.size();
    candidates_.emplace(candidate_hash,
                        CandidateEntry{
                            .group_index = group_index,
                            .validators = std::move(group_validators),
                            .local = StatementFilter(group_size),
                            .statements = {},
                            .peers = {},
                            .confirmed = std::nullopt,
                        });
  }

  bool KnowledgeStore::has_candidate(
      const CandidateHash &candidate_hash) const {
    return candidates_.contains(candidate_hash);
  }

  std::optional<GroupIndex> KnowledgeStore::group_index(
      const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return std::nullopt;
    }
    return it->second.group_index;
  }

  std::optional<std::span<const ValidatorIndex>>
  KnowledgeStore::group_validators(const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return std::nullopt;
    }
    return std::span<const ValidatorIndex>{it->second.validators};
  }

  std::optional<size_t> KnowledgeStore::position_in_group(
      const CandidateHash &candidate_hash, ValidatorIndex validator) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return std::nullopt;
    }
    const auto &validators = it->second.validators;
    auto pos = std::find(validators.begin(), validators.end(), validator);
    if (pos == validators.end()) {
      return std::nullopt;
    }
    return static_cast<size_t>(std::distance(validators.begin(), pos));
  }

  outcome::result<std::pair<KnowledgeStore::CandidateEntry *, size_t>>
  KnowledgeStore::locate(const CandidateHash &candidate_hash,
                         ValidatorIndex validator) {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return KnowledgeStoreError::UNKNOWN_CANDIDATE;
    }
    auto position = position_in_group(candidate_hash, validator);
    if (not position) {
      return KnowledgeStoreError::VALIDATOR_NOT_IN_GROUP;
    }
    return std::make_pair(&it->second, *position);
  }

  const PeerKnowledge *KnowledgeStore::find_peer(
      const PeerId &peer, const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return nullptr;
    }
    auto peer_it = it->second.peers.find(peer);
    if (peer_it == it->second.peers.end()) {
      return nullptr;
    }
    return &peer_it->second;
  }

  outcome::result<void> KnowledgeStore::record_local(
      const CandidateHash &candidate_hash,
      ValidatorIndex validator,
      StatementKind kind) {
    OUTCOME_TRY(located, locate(candidate_hash, validator));
    auto &[entry, position] = located;
    entry->local.set(position, kind);
    return outcome::success();
  }

  outcome::result<void> KnowledgeStore::record_peer(
      const PeerId &peer,
      const CandidateHash &candidate_hash,
      ValidatorIndex validator,
      StatementKind kind) {
    OUTCOME_TRY(located, locate(candidate_hash, validator));
    auto &[entry, position] = located;
    const auto group_size = entry->validators.size();
    auto [it, _] = entry->peers.try_emplace(
        peer,
        PeerKnowledge{StatementFilter(group_size),
                      StatementFilter(group_size)});
    it->second.sent.set(position, kind);
    return outcome::success();
  }

  outcome::result<void> KnowledgeStore::record_received(
      const PeerId &peer,
      const CandidateHash &candidate_hash,
      ValidatorIndex validator,
      StatementKind kind) {
    OUTCOME_TRY(located, locate(candidate_hash, validator));
    auto &[entry, position] = located;
    const auto group_size = entry->validators.size();
    auto [it, _] = entry->peers.try_emplace(
        peer,
        PeerKnowledge{StatementFilter(group_size),
                      StatementFilter(group_size)});
    it->second.received.set(position, kind);
    return outcome::success();
  }

  outcome::result<void> KnowledgeStore::record_received_filter(
      const PeerId &peer,
      const CandidateHash &candidate_hash,
      const StatementFilter &filter) {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return KnowledgeStoreError::UNKNOWN_CANDIDATE;
    }
    const auto &validators = it->second.validators;
    for (size_t ix = 0; ix < validators.size(); ++ix) {
      for (auto kind : {StatementKind::Seconded, StatementKind::Valid}) {
        if (filter.contains(ix, kind)) {
          OUTCOME_TRY(
              record_received(peer, candidate_hash, validators[ix], kind));
        }
      }
    }
    return outcome::success();
  }

  outcome::result<StatementFilter> KnowledgeStore::mask_for(
      const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return KnowledgeStoreError::UNKNOWN_CANDIDATE;
    }
    return it->second.local;
  }

  bool KnowledgeStore::is_known_locally(const CandidateHash &candidate_hash,
                                        ValidatorIndex validator,
                                        StatementKind kind) const {
    auto position = position_in_group(candidate_hash, validator);
    if (not position) {
      return false;
    }
    return candidates_.at(candidate_hash).local.contains(*position, kind);
  }

  bool KnowledgeStore::is_known_by_peer(const PeerId &peer,
                                        const CandidateHash &candidate_hash,
                                        ValidatorIndex validator,
                                        StatementKind kind) const {
    auto position = position_in_group(candidate_hash, validator);
    const auto *knowledge = find_peer(peer, candidate_hash);
    if (not position or knowledge == nullptr) {
      return false;
    }
    return knowledge->sent.contains(*position, kind)
        or knowledge->received.contains(*position, kind);
  }

  bool KnowledgeStore::lacks_claimed_by(
      const PeerId &peer, const CandidateHash &candidate_hash) const {
    const auto *knowledge = find_peer(peer, candidate_hash);
    if (knowledge == nullptr) {
      return false;
    }
    return candidates_.at(candidate_hash).local.lacks_any_of(
        knowledge->received);
  }

  bool KnowledgeStore::was_received_from(const PeerId &peer,
                                         const CandidateHash &candidate_hash,
                                         ValidatorIndex validator,
                                         StatementKind kind) const {
    auto position = position_in_group(candidate_hash, validator);
    const auto *knowledge = find_peer(peer, candidate_hash);
    if (not position or knowledge == nullptr) {
      return false;
    }
    return knowledge->received.contains(*position, kind);
  }

  outcome::result<bool> KnowledgeStore::store_statement(
      const CandidateHash &candidate_hash,
      const SignedCompactStatement &statement) {
    auto kind = network::vstaging::statementKind(getPayload(statement));
    if (not kind) {
      return KnowledgeStoreError::UNKNOWN_CANDIDATE;
    }
    const auto validator = statement.payload.ix;
    OUTCOME_TRY(located, locate(candidate_hash, validator));
    auto &[entry, position] = located;
    if (entry->local.contains(position, *kind)) {
      return false;
    }
    entry->local.set(position, *kind);
    entry->statements.emplace_back(statement);
    return true;
  }

  CandidateKnowledgeState KnowledgeStore::knowledge_state(
      const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return CandidateKnowledgeState::kUnknown;
    }
    const auto &local = it->second.local;
    const auto known = local.backing_validators();
    if (known == 0) {
      return CandidateKnowledgeState::kUnknown;
    }
    // each validator issues either `Seconded` or `Valid` about a candidate
    if (known < it->second.validators.size()) {
      return CandidateKnowledgeState::kPartiallyKnown;
    }
    return CandidateKnowledgeState::kFullyKnown;
  }

  void KnowledgeStore::confirm(
      const CandidateHash &candidate_hash,
      network::CommittedCandidateReceipt receipt,
      runtime::PersistedValidationData persisted_validation_data) {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end() or it->second.confirmed) {
      return;
    }
    it->second.confirmed = ConfirmedCandidate{
        .receipt = std::move(receipt),
        .persisted_validation_data = std::move(persisted_validation_data),
    };
  }

  std::optional<std::reference_wrapper<const ConfirmedCandidate>>
  KnowledgeStore::confirmed(const CandidateHash &candidate_hash) const {
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end() or not it->second.confirmed) {
      return std::nullopt;
    }
    return std::cref(*it->second.confirmed);
  }

  std::vector<SignedCompactStatement> KnowledgeStore::statements_for(
      const CandidateHash &candidate_hash,
      const StatementFilter &unwanted) const {
    std::vector<SignedCompactStatement> result;
    auto it = candidates_.find(candidate_hash);
    if (it == candidates_.end()) {
      return result;
    }
    const auto &entry = it->second;
    for (auto kind : {StatementKind::Seconded, StatementKind::Valid}) {
      for (const auto &statement : entry.statements) {
        if (network::vstaging::statementKind(getPayload(statement)) != kind) {
          continue;
        }
        auto position = position_in_group(candidate_hash, statement.payload.ix);
        if (position and not unwanted.contains(*position, kind)) {
          result.emplace_back(statement);
        }
      }
    }
    return result;
  }

}  // namespace attesta::parachain::statement_distribution

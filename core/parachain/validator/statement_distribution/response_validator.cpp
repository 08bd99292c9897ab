/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/response_validator.hpp"

#include <boost/assert.hpp>

namespace attesta::parachain::statement_distribution {

  ResponseValidator::ResponseValidator(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
      ResponseValidationPolicy policy)
      : hasher_{std::move(hasher)},
        sr25519_provider_{std::move(sr25519_provider)},
        policy_{policy} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(sr25519_provider_);
  }

  outcome::result<network::vstaging::AttestedCandidateResponse>
  ResponseValidator::decode(const CandidateHash &requested_candidate,
                            const RelayHash &relay_parent,
                            common::BufferView raw_response) const {
    auto decoded =
        scale::decode<network::vstaging::AttestedCandidateResponse>(
            raw_response);
    if (decoded.has_error()) {
      return StatementDistributionError::RESPONSE_DECODE_FAILED;
    }
    auto &response = decoded.value();
    const auto &descriptor = response.candidate_receipt.descriptor;

    if (network::candidateHash(*hasher_, response.candidate_receipt)
        != requested_candidate) {
      return StatementDistributionError::CANDIDATE_HASH_MISMATCH;
    }
    if (descriptor.relay_parent != relay_parent) {
      return StatementDistributionError::RELAY_PARENT_MISMATCH;
    }
    if (hasher_->blake2b_256(
            scale::encode(response.persisted_validation_data).value())
        != descriptor.persisted_data_hash) {
      return StatementDistributionError::PVD_HASH_MISMATCH;
    }
    return std::move(response);
  }

  bool ResponseValidator::check_signature(
      const SignedCompactStatement &statement,
      const SigningContext &signing_context,
      std::span<const ValidatorId> validator_keys) const {
    const auto validator = statement.payload.ix;
    if (validator >= validator_keys.size()) {
      return false;
    }
    auto verified = sr25519_provider_->verify(
        statement.signature,
        signing_context.signable(getPayload(statement)),
        validator_keys[validator]);
    if (verified.has_error()) {
      SL_DEBUG(logger_,
               "Signature check of validator {} failed: {}",
               validator,
               verified.error());
      return false;
    }
    return verified.value();
  }

  ResponseValidationResult ResponseValidator::validate(
      const PeerId &peer,
      const OutstandingRequest &request,
      const SigningContext &signing_context,
      std::span<const ValidatorId> validator_keys,
      common::BufferView raw_response,
      KnowledgeStore &knowledge) const {
    ResponseValidationResult result;
    const auto &candidate_hash = request.candidate_hash;

    auto decoded =
        decode(candidate_hash, signing_context.relay_parent, raw_response);
    if (decoded.has_error()) {
      SL_DEBUG(logger_,
               "Malformed response from peer {} for candidate {}: {}",
               peer,
               candidate_hash,
               decoded.error());
      result.rejection = StatementDistributionError::RESPONSE_DECODE_FAILED;
      for (auto reason : {StatementDistributionError::CANDIDATE_HASH_MISMATCH,
                          StatementDistributionError::RELAY_PARENT_MISMATCH,
                          StatementDistributionError::PVD_HASH_MISMATCH}) {
        if (decoded.error() == reason) {
          result.rejection = reason;
        }
      }
      result.events.emplace_back(ReputationEvent::kMalformedResponse);
      return result;
    }
    auto &response = decoded.value();

    const auto group_size =
        knowledge.group_validators(candidate_hash)
            .value_or(std::span<const ValidatorIndex>{})
            .size();
    StatementFilter received_in_response(group_size);

    for (const auto &statement : response.statements) {
      const auto &compact = getPayload(statement);
      const auto validator = statement.payload.ix;
      const auto kind = network::vstaging::statementKind(compact);
      const auto statement_candidate =
          network::vstaging::candidateHash(compact);
      const auto position =
          knowledge.position_in_group(candidate_hash, validator);

      if (kind and position
          and received_in_response.contains(*position, *kind)) {
        SL_TRACE(logger_,
                 "Duplicate statement of validator {} from peer {}",
                 validator,
                 peer);
        result.events.emplace_back(ReputationEvent::kDuplicateStatement);
        continue;
      }

      if (not kind or not position or statement_candidate != candidate_hash
          or request.mask.contains(*position, *kind)) {
        SL_TRACE(logger_,
                 "Unrequested statement of validator {} from peer {}",
                 validator,
                 peer);
        result.events.emplace_back(
            ReputationEvent::kUnrequestedResponseStatement);
        continue;
      }

      if (not check_signature(statement, signing_context, validator_keys)) {
        SL_TRACE(logger_,
                 "Invalid signature of validator {} from peer {}",
                 validator,
                 peer);
        result.events.emplace_back(ReputationEvent::kInvalidSignature);
        if (policy_.punish_invalid_signature_provider) {
          result.events.emplace_back(ReputationEvent::kBadDataProvider);
        }
        continue;
      }

      auto fresh = knowledge.store_statement(candidate_hash, statement);
      if (fresh.has_error()) {
        SL_WARN(logger_,
                "Can't store statement of validator {}: {}",
                validator,
                fresh.error());
        continue;
      }
      if (auto res = knowledge.record_received(
              peer, candidate_hash, validator, *kind);
          res.has_error()) {
        SL_WARN(logger_,
                "Can't record statement of validator {} as received: {}",
                validator,
                res.error());
      }
      received_in_response.set(*position, *kind);

      SL_TRACE(logger_,
               "Accepted statement of validator {} from peer {}",
               validator,
               peer);
      result.events.emplace_back(
          policy_.first_benefit_in_responses and fresh.value()
              ? ReputationEvent::kFirstValidStatement
              : ReputationEvent::kValidStatement);
      result.accepted.emplace_back(statement);
    }

    if (not result.accepted.empty()
        or policy_.grant_response_benefit_when_all_rejected) {
      result.events.emplace_back(ReputationEvent::kValidResponse);
    }
    result.confirmed = ConfirmedCandidate{
        .receipt = std::move(response.candidate_receipt),
        .persisted_validation_data =
            std::move(response.persisted_validation_data),
    };
    return result;
  }

}  // namespace attesta::parachain::statement_distribution

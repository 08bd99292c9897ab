/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "parachain/validator/signing_context.hpp"
#include "parachain/validator/statement_distribution/knowledge_store.hpp"
#include "parachain/validator/statement_distribution/statement_distribution_error.hpp"
#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  struct ResponseValidationPolicy {
    /// Additionally report `kBadDataProvider` for each invalid signature.
    bool punish_invalid_signature_provider = false;
    /// Reward statements first seen in a response as first-valid.
    bool first_benefit_in_responses = false;
    /// Grant `kValidResponse` even if no statement got accepted.
    bool grant_response_benefit_when_all_rejected = true;
  };

  struct ResponseValidationResult {
    /// Reputation events for the responding peer, in detection order.
    std::vector<ReputationEvent> events;
    /// Statements recorded into the knowledge store, in response order.
    std::vector<SignedCompactStatement> accepted;
    /// Receipt and validation data, set when the response is well-formed.
    std::optional<ConfirmedCandidate> confirmed;
    /// Why the response was rejected as a whole.
    std::optional<StatementDistributionError> rejection;
  };

  /**
   * Checks an untrusted attested candidate response against the request it
   * answers. A malformed response is rejected as a whole; otherwise each
   * statement is classified in arrival order as duplicate, unrequested,
   * badly signed or accepted.
   */
  class ResponseValidator {
   public:
    ResponseValidator(std::shared_ptr<crypto::Hasher> hasher,
                      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
                      ResponseValidationPolicy policy);

    /// Decodes the response and checks receipt, validation data and relay
    /// parent against the request.
    outcome::result<network::vstaging::AttestedCandidateResponse> decode(
        const CandidateHash &requested_candidate,
        const RelayHash &relay_parent,
        common::BufferView raw_response) const;

    /// Validates response of `peer` to `request`. Accepted statements are
    /// recorded into `knowledge` as known locally and received from `peer`.
    ResponseValidationResult validate(
        const PeerId &peer,
        const OutstandingRequest &request,
        const SigningContext &signing_context,
        std::span<const ValidatorId> validator_keys,
        common::BufferView raw_response,
        KnowledgeStore &knowledge) const;

    /// Whether statement is signed by its validator under `signing_context`.
    bool check_signature(const SignedCompactStatement &statement,
                         const SigningContext &signing_context,
                         std::span<const ValidatorId> validator_keys) const;

   private:

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    ResponseValidationPolicy policy_;
    log::Logger logger_ =
        log::createLogger("ResponseValidator", "statement_distribution");
  };

}  // namespace attesta::parachain::statement_distribution

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace attesta::parachain::statement_distribution {
  enum class KnowledgeStoreError {
    UNKNOWN_CANDIDATE = 1,
    VALIDATOR_NOT_IN_GROUP = 2,
  };

  enum class StatementDistributionError {
    UNKNOWN_RELAY_PARENT = 1,
    UNKNOWN_CANDIDATE = 2,
    CANDIDATE_NOT_CONFIRMED = 3,
    INVALID_MASK_LENGTH = 4,
    REQUEST_ALREADY_OUTSTANDING = 5,
    PEER_NOT_IN_VIEW = 6,
    KNOWLEDGE_COMPLETE = 7,
    RESPONSE_DECODE_FAILED = 8,
    CANDIDATE_HASH_MISMATCH = 9,
    PVD_HASH_MISMATCH = 10,
    RELAY_PARENT_MISMATCH = 11,
  };
}  // namespace attesta::parachain::statement_distribution

OUTCOME_HPP_DECLARE_ERROR(attesta::parachain::statement_distribution,
                          KnowledgeStoreError);
OUTCOME_HPP_DECLARE_ERROR(attesta::parachain::statement_distribution,
                          StatementDistributionError);

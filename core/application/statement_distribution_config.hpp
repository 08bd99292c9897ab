/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

#include "parachain/validator/statement_distribution/reputation_ledger.hpp"
#include "parachain/validator/statement_distribution/request_scheduler.hpp"
#include "parachain/validator/statement_distribution/response_validator.hpp"

namespace attesta::application {

  /// Tunables of statement distribution.
  struct StatementDistributionConfig {
    std::chrono::milliseconds request_timeout{2000};
    uint32_t max_request_retries = 2;
    bool retry_with_other_peer = true;
    bool punish_invalid_signature_provider = false;
    bool first_benefit_in_responses = false;
    bool grant_response_benefit_when_all_rejected = true;
    /// Charge a peer whose response lacks statements it advertised.
    bool punish_withheld_statements = false;
    parachain::statement_distribution::ReputationTable reputation;

    parachain::statement_distribution::RequestPolicy requestPolicy() const {
      return {
          .request_timeout = request_timeout,
          .max_request_retries = max_request_retries,
          .retry_with_other_peer = retry_with_other_peer,
      };
    }

    parachain::statement_distribution::ResponseValidationPolicy
    validationPolicy() const {
      return {
          .punish_invalid_signature_provider =
              punish_invalid_signature_provider,
          .first_benefit_in_responses = first_benefit_in_responses,
          .grant_response_benefit_when_all_rejected =
              grant_response_benefit_when_all_rejected,
      };
    }
  };

}  // namespace attesta::application

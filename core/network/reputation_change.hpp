/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace attesta::network {

  using Reputation = std::int32_t;

  struct ReputationChange {
   public:
    Reputation value;
    std::string_view reason;

    bool operator==(const ReputationChange &other) const = default;
  };

  namespace reputation {

    // clang-format off
    namespace cost {
      const ReputationChange UNEXPECTED_STATEMENT          = {.value = -100000, .reason = "Unexpected Statement"};
      const ReputationChange INVALID_SIGNATURE             = {.value = -300000, .reason = "Invalid Statement Signature"};
      const ReputationChange UNREQUESTED_RESPONSE_STATEMENT = {.value = -300000, .reason = "Un-requested Statement In Response"};
      const ReputationChange DUPLICATE_STATEMENT           = {.value = -200000, .reason = "Duplicate Statement"};
      const ReputationChange BAD_DATA_PROVIDER             = {.value = -100000, .reason = "Peer provided invalid statement data"};
      const ReputationChange IMPROPERLY_DECODED_RESPONSE   = {.value = -300000, .reason = "Improperly Encoded Candidate Response"};
      const ReputationChange UNEXPECTED_REQUEST            = {.value = -300000, .reason = "Unexpected attested candidate request"};
      const ReputationChange MALFORMED_MANIFEST            = {.value = -300000, .reason = "Manifest Malformed"};
      const ReputationChange WITHHELD_STATEMENTS           = {.value = -100000, .reason = "Response lacks statements the peer advertised"};
    }  // namespace cost

    namespace benefit {
      const ReputationChange VALID_STATEMENT_FIRST         = {.value = 300000,  .reason = "Peer was the first to provide a given valid statement"};
      const ReputationChange VALID_STATEMENT               = {.value = 200000,  .reason = "Peer provided a valid statement"};
      const ReputationChange VALID_RESPONSE                = {.value = 200000,  .reason = "Peer Answered Candidate Request"};
    }  // namespace benefit
    // clang-format on

  }  // namespace reputation

}  // namespace attesta::network

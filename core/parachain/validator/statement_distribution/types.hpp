/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <libp2p/peer/peer_id.hpp>

#include "network/types/collator_messages_vstaging.hpp"
#include "parachain/types.hpp"

namespace attesta::parachain::statement_distribution {

  using libp2p::peer::PeerId;
  using network::vstaging::SignedCompactStatement;
  using network::vstaging::StatementFilter;
  using network::vstaging::StatementKind;

  using Clock = std::chrono::steady_clock;

  /// Identifies one sent request, never reused within a relay parent.
  using RequestId = uint64_t;

  enum class CandidateKnowledgeState {
    kUnknown,
    kPartiallyKnown,
    kFullyKnown,
  };

  enum class RequestReason {
    /// A cluster peer sent us a statement and we lack some of the others.
    kGapFill,
    /// A manifest showed statements we do not have.
    kManifestCatchUp,
  };

  enum class ReputationEvent {
    kFirstValidStatement,
    kValidStatement,
    kValidResponse,
    kUnrequestedResponseStatement,
    kDuplicateStatement,
    kInvalidSignature,
    kBadDataProvider,
    kMalformedResponse,
    kUnexpectedStatement,
    kUnexpectedRequest,
    kMalformedManifest,
    kWithheldStatements,
  };

  inline std::string_view toString(ReputationEvent event) {
    switch (event) {
      case ReputationEvent::kFirstValidStatement:
        return "first-valid-statement";
      case ReputationEvent::kValidStatement:
        return "valid-statement";
      case ReputationEvent::kValidResponse:
        return "valid-response";
      case ReputationEvent::kUnrequestedResponseStatement:
        return "unrequested-response-statement";
      case ReputationEvent::kDuplicateStatement:
        return "duplicate-statement";
      case ReputationEvent::kInvalidSignature:
        return "invalid-signature";
      case ReputationEvent::kBadDataProvider:
        return "bad-data-provider";
      case ReputationEvent::kMalformedResponse:
        return "malformed-response";
      case ReputationEvent::kUnexpectedStatement:
        return "unexpected-statement";
      case ReputationEvent::kUnexpectedRequest:
        return "unexpected-request";
      case ReputationEvent::kMalformedManifest:
        return "malformed-manifest";
      case ReputationEvent::kWithheldStatements:
        return "withheld-statements";
    }
    return "unknown";
  }

  /// Inverse of `toString`, used for config keys.
  inline std::optional<ReputationEvent> reputationEventFromString(
      std::string_view name) {
    for (auto event : {ReputationEvent::kFirstValidStatement,
                       ReputationEvent::kValidStatement,
                       ReputationEvent::kValidResponse,
                       ReputationEvent::kUnrequestedResponseStatement,
                       ReputationEvent::kDuplicateStatement,
                       ReputationEvent::kInvalidSignature,
                       ReputationEvent::kBadDataProvider,
                       ReputationEvent::kMalformedResponse,
                       ReputationEvent::kUnexpectedStatement,
                       ReputationEvent::kUnexpectedRequest,
                       ReputationEvent::kMalformedManifest,
                       ReputationEvent::kWithheldStatements}) {
      if (toString(event) == name) {
        return event;
      }
    }
    return std::nullopt;
  }

  /// Request in flight to one peer for one candidate.
  struct OutstandingRequest {
    RequestId id;
    PeerId peer;
    CandidateHash candidate_hash;
    /// Local knowledge at send time.
    StatementFilter mask;
    Clock::time_point deadline;
    RequestReason reason;
    /// 0 for the first request, incremented on each retry.
    uint32_t attempt;
  };

}  // namespace attesta::parachain::statement_distribution

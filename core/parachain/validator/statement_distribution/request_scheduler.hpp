/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "log/logger.hpp"
#include "network/i_peer_view.hpp"
#include "outcome/outcome.hpp"
#include "parachain/validator/network_bridge.hpp"
#include "parachain/validator/statement_distribution/knowledge_store.hpp"
#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  struct RequestPolicy {
    std::chrono::milliseconds request_timeout{2000};
    /// Number of retries after the first request timed out.
    uint32_t max_request_retries = 2;
    /// Retry against another peer having the relay parent in view.
    bool retry_with_other_peer = true;
  };

  /// What to do about a request that timed out.
  struct RetryDecision {
    enum class Action {
      kGiveUp,
      kRetrySamePeer,
      kRetryOtherPeer,
    };

    Action action;
    PeerId peer;
    CandidateHash candidate_hash;
    RequestReason reason;
    uint32_t next_attempt;
  };

  /**
   * Issues attested candidate requests for one relay parent. At most one
   * request per (peer, candidate) is in flight, and the mask attached is the
   * local knowledge at send time.
   */
  class RequestScheduler {
   public:
    /// Receives the response together with the id of the request it
    /// answers.
    using ResponseHandler =
        std::function<void(RequestId, outcome::result<common::Buffer>)>;

    RequestScheduler(RelayHash relay_parent,
                     RequestPolicy policy,
                     std::shared_ptr<network::IPeerView> peer_view,
                     std::shared_ptr<NetworkBridge> network_bridge);

    /// Sends a request unless knowledge is complete, a request is already
    /// outstanding or the peer does not have the relay parent in view.
    outcome::result<void> maybe_request(const KnowledgeStore &knowledge,
                                        const CandidateHash &candidate_hash,
                                        const PeerId &peer,
                                        RequestReason reason,
                                        Clock::time_point now,
                                        ResponseHandler handler,
                                        uint32_t attempt = 0);

    bool is_outstanding(const PeerId &peer,
                        const CandidateHash &candidate_hash) const;

    /// Removes and returns the outstanding request a response belongs to.
    /// A response to a request which was replaced by a newer one to the same
    /// peer matches nothing.
    std::optional<OutstandingRequest> take(const PeerId &peer,
                                           const CandidateHash &candidate_hash,
                                           RequestId id);

    /// Retry policy applied to a request that failed or timed out.
    RetryDecision decide_retry(const OutstandingRequest &request) const;

    /// Clears a timed out request and decides whether to retry it.
    std::optional<RetryDecision> on_timeout(
        const PeerId &peer, const CandidateHash &candidate_hash);

    /// Outstanding requests with deadline not after `now`.
    std::vector<std::pair<PeerId, CandidateHash>> expire(
        Clock::time_point now) const;

    void cancel_all();

    size_t outstanding_count() const {
      return outstanding_.size();
    }

   private:
    using RequestKey = std::pair<PeerId, CandidateHash>;

    RelayHash relay_parent_;
    RequestPolicy policy_;
    std::shared_ptr<network::IPeerView> peer_view_;
    std::shared_ptr<NetworkBridge> network_bridge_;
    std::map<RequestKey, OutstandingRequest> outstanding_;
    RequestId next_request_id_ = 0;
    log::Logger logger_ =
        log::createLogger("RequestScheduler", "statement_distribution");
  };

}  // namespace attesta::parachain::statement_distribution

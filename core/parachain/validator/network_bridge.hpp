/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <vector>

#include <libp2p/peer/peer_id.hpp>

#include "common/buffer.hpp"
#include "network/reputation_change.hpp"
#include "network/types/collator_messages_vstaging.hpp"
#include "outcome/outcome.hpp"

namespace attesta::parachain {

  /// What to do when a request targets a peer that is not connected.
  enum class IfDisconnected {
    /// Fail the send at once.
    kImmediateError,
    /// Dial the peer and send once connected.
    kTryConnect,
  };

  /**
   * Outbound side of the network layer used by statement distribution:
   * peer reports, attested candidate requests and validation gossip.
   */
  struct NetworkBridge {
    using PeerId = libp2p::peer::PeerId;
    using ResponseHandler =
        std::function<void(outcome::result<common::Buffer>)>;

    virtual ~NetworkBridge() = default;

    virtual void report_peer(const PeerId &peer,
                             const network::ReputationChange &change) = 0;

    /// Sends request, `handler` receives raw response bytes or the network
    /// error. A synchronous failure means `handler` is never called.
    virtual outcome::result<void> send_attested_candidate_request(
        const PeerId &peer,
        const network::vstaging::AttestedCandidateRequest &request,
        IfDisconnected if_disconnected,
        ResponseHandler handler) = 0;

    virtual void send_validation_message(
        const std::vector<PeerId> &peers,
        const network::vstaging::StatementDistributionMessage &message) = 0;
  };

}  // namespace attesta::parachain

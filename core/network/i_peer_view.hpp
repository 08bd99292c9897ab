/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <libp2p/peer/peer_id.hpp>

#include "parachain/types.hpp"

namespace attesta::network {

  /**
   * Connected peers together with the relay parents each of them announced
   * in its view. Maintained by the connection layer.
   */
  class IPeerView {
   public:
    using PeerId = libp2p::peer::PeerId;

    virtual ~IPeerView() = default;

    virtual bool peerHasRelayParent(
        const PeerId &peer_id,
        const parachain::RelayHash &relay_parent) const = 0;

    /// Connected peers having `relay_parent` in view, in no particular order.
    virtual std::vector<PeerId> peersWithRelayParent(
        const parachain::RelayHash &relay_parent) const = 0;
  };

}  // namespace attesta::network

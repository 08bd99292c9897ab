/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/types.hpp"

namespace attesta::runtime {

  using parachain::BlockNumber;
  using parachain::Hash;
  using parachain::HeadData;
  using parachain::SessionIndex;

  struct PersistedValidationData {
    /// The parent head-data.
    HeadData parent_head;
    /// The relay-chain block number this is in the context of.
    BlockNumber relay_parent_number;
    /// The relay-chain block storage root this is in the context of.
    Hash relay_parent_storage_root;
    /// The maximum legal size of a POV block, in bytes.
    uint32_t max_pov_size;

    bool operator==(const PersistedValidationData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PersistedValidationData &v) {
    return s << v.parent_head << v.relay_parent_number
             << v.relay_parent_storage_root << v.max_pov_size;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PersistedValidationData &v) {
    return s >> v.parent_head >> v.relay_parent_number
        >> v.relay_parent_storage_root >> v.max_pov_size;
  }

}  // namespace attesta::runtime

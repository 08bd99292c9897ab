/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>

#include <scale/scale.hpp>

#include "network/types/collator_messages_vstaging.hpp"
#include "parachain/types.hpp"

namespace attesta::parachain {

  /// Session index and relay parent a statement is signed under.
  struct SigningContext {
    /// Current session index.
    SessionIndex session_index;
    /// Hash of the parent.
    RelayHash relay_parent;

    /// Make signable message for payload.
    common::Buffer signable(
        const network::vstaging::CompactStatement &payload) const;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SigningContext &v) {
    return s << v.session_index << v.relay_parent;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SigningContext &v) {
    return s >> v.session_index >> v.relay_parent;
  }

  inline common::Buffer SigningContext::signable(
      const network::vstaging::CompactStatement &payload) const {
    return scale::encode(std::tie(payload, *this)).value();
  }

}  // namespace attesta::parachain

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <type_traits>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/sr25519_types.hpp"

namespace attesta::parachain {

  using Hash = common::Hash256;
  using Signature = crypto::Sr25519Signature;
  using ParachainId = uint32_t;
  using ValidatorIndex = uint32_t;
  using ValidatorId = crypto::Sr25519PublicKey;
  using HeadData = common::Buffer;
  using CandidateHash = Hash;
  using RelayHash = Hash;
  using GroupIndex = uint32_t;
  using SessionIndex = uint32_t;
  using BlockNumber = uint32_t;

  /// Signature with which parachain validators sign statements.
  using ValidatorSignature = Signature;

  template <typename D>
  struct Indexed {
    using Type = std::decay_t<D>;

    Type payload;
    ValidatorIndex ix;

    bool operator==(const Indexed &other) const = default;
  };

  template <typename T>
  using IndexedAndSigned = crypto::Sr25519Signed<Indexed<T>>;

  template <typename T>
  [[maybe_unused]] inline const T &getPayload(const IndexedAndSigned<T> &t) {
    return t.payload.payload;
  }

  template <typename T>
  [[maybe_unused]] inline T &getPayload(IndexedAndSigned<T> &t) {
    return t.payload.payload;
  }

  template <class Stream,
            typename D,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Indexed<D> &v) {
    return s << v.payload << v.ix;
  }

  template <class Stream,
            typename D,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Indexed<D> &v) {
    return s >> v.payload >> v.ix;
  }

}  // namespace attesta::parachain

namespace attesta::crypto {

  template <class Stream,
            typename T,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Sr25519Signed<T> &v) {
    return s << v.payload << v.signature;
  }

  template <class Stream,
            typename T,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Sr25519Signed<T> &v) {
    return s >> v.payload >> v.signature;
  }

}  // namespace attesta::crypto

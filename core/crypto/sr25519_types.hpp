/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace attesta::crypto {
  namespace constants::sr25519 {
    /**
     * Important constants to deal with sr25519
     */
    enum {
      PUBLIC_SIZE = 32,
      SIGNATURE_SIZE = 64,
    };
  }  // namespace constants::sr25519
}  // namespace attesta::crypto

ATTESTA_BLOB_STRICT_TYPEDEF(attesta::crypto,
                            Sr25519PublicKey,
                            constants::sr25519::PUBLIC_SIZE);
ATTESTA_BLOB_STRICT_TYPEDEF(attesta::crypto,
                            Sr25519Signature,
                            constants::sr25519::SIGNATURE_SIZE);

namespace attesta::crypto {

  /// Payload together with the sr25519 signature over its signable form.
  template <typename T>
  struct Sr25519Signed {
    using Type = std::decay_t<T>;

    Type payload;
    Sr25519Signature signature;

    bool operator==(const Sr25519Signed &other) const = default;
  };

}  // namespace attesta::crypto

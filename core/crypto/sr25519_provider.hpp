/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace attesta::crypto {

  /**
   * Signature checks consumed by statement handling. Key management and
   * signing live outside of this library.
   */
  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    /**
     * Verifies that \param message was derived using \param public_key on
     * \param signature
     */
    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        common::BufferView message,
        const Sr25519PublicKey &public_key) const = 0;
  };
}  // namespace attesta::crypto

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace attesta::common {

  /// Owned byte sequence, the unit messages travel the wire in.
  using Buffer = std::vector<uint8_t>;

  /// Non-owning view over encoded bytes.
  using BufferView = std::span<const uint8_t>;

}  // namespace attesta::common

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/buffer.hpp"

namespace attesta::common {

  /// Lowercase hex of `bytes`, without prefix.
  std::string hex_lower(BufferView bytes);

}  // namespace attesta::common

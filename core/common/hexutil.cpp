/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <fmt/format.h>
#include <qtils/hex.hpp>

namespace attesta::common {
  std::string hex_lower(BufferView bytes) {
    return fmt::format("{:x}", bytes);
  }
}  // namespace attesta::common

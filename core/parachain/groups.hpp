/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "parachain/types.hpp"

namespace attesta::parachain {

  /// Validator groups of a session, as assigned at a relay parent.
  struct Groups {
    std::unordered_map<GroupIndex, std::vector<ValidatorIndex>> groups;
    std::unordered_map<ValidatorIndex, GroupIndex> by_validator_index;

    Groups() = default;

    explicit Groups(const std::vector<std::vector<ValidatorIndex>> &grs) {
      for (GroupIndex g = 0; g < grs.size(); ++g) {
        const auto &group = grs[g];
        groups[g] = group;
        for (const auto &v : group) {
          by_validator_index[v] = g;
        }
      }
    }

    std::optional<GroupIndex> byValidatorIndex(
        ValidatorIndex validator_index) const {
      auto it = by_validator_index.find(validator_index);
      if (it != by_validator_index.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    std::optional<std::span<const ValidatorIndex>> get(
        GroupIndex group_index) const {
      auto group = groups.find(group_index);
      if (group == groups.end()) {
        return std::nullopt;
      }
      return group->second;
    }
  };

}  // namespace attesta::parachain

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "parachain/validator/statement_distribution/types.hpp"

namespace attesta::parachain::statement_distribution {

  enum class HypotheticalMembership {
    kMember,
    kNotMember,
    /// The fragment tree has not decided yet.
    kPending,
  };

  /// Fragment-tree check whether a candidate could extend some leaf.
  class IHypotheticalMembership {
   public:
    virtual ~IHypotheticalMembership() = default;

    virtual HypotheticalMembership check(
        const RelayHash &relay_parent,
        const CandidateHash &candidate_hash) const = 0;
  };

}  // namespace attesta::parachain::statement_distribution

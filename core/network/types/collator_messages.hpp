/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>
#include <vector>

#include <scale/scale.hpp>

#include "crypto/hasher.hpp"
#include "parachain/types.hpp"

namespace attesta::network {
  using parachain::BlockNumber;
  using parachain::CandidateHash;
  using parachain::GroupIndex;
  using parachain::Hash;
  using parachain::HeadData;
  using parachain::ParachainId;
  using parachain::RelayHash;
  using parachain::ValidatorIndex;

  /// Empty element.
  using Empty = std::tuple<>;

  /**
   * Unique descriptor of a candidate receipt.
   */
  struct CandidateDescriptor {
    ParachainId para_id;  /// Parachain Id
    RelayHash relay_parent;  /// Hash of the relay chain block the candidate is
                             /// executed in the context of
    Hash persisted_data_hash;  /// Hash of the persisted validation data
    Hash pov_hash;             /// Hash of the PoV block.
    Hash para_head_hash;  /// Hash of the parachain head data of this candidate.

    bool operator==(const CandidateDescriptor &) const = default;
  };

  struct CandidateCommitments {
    HeadData para_head;  /// parachain head data
    BlockNumber watermark;  /// watermark which specifies the relay chain block
                            /// number up to which all inbound horizontal
                            /// messages have been processed

    bool operator==(const CandidateCommitments &) const = default;
  };

  /**
   * Contains commitments
   */
  struct CommittedCandidateReceipt {
    CandidateDescriptor descriptor;    /// Candidate descriptor
    CandidateCommitments commitments;  /// commitments retrieved from validation
                                       /// result and produced by the execution
                                       /// and validation parachain candidate

    bool operator==(const CommittedCandidateReceipt &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const CandidateDescriptor &v) {
    return s << v.para_id << v.relay_parent << v.persisted_data_hash
             << v.pov_hash << v.para_head_hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, CandidateDescriptor &v) {
    return s >> v.para_id >> v.relay_parent >> v.persisted_data_hash
        >> v.pov_hash >> v.para_head_hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const CandidateCommitments &v) {
    return s << v.para_head << v.watermark;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, CandidateCommitments &v) {
    return s >> v.para_head >> v.watermark;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const CommittedCandidateReceipt &v) {
    return s << v.descriptor << v.commitments;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, CommittedCandidateReceipt &v) {
    return s >> v.descriptor >> v.commitments;
  }

  inline CandidateHash candidateHash(const crypto::Hasher &hasher,
                                     const CommittedCandidateReceipt &receipt) {
    auto commitments_hash =
        hasher.blake2b_256(scale::encode(receipt.commitments).value());
    return hasher.blake2b_256(
        scale::encode(std::tie(receipt.descriptor, commitments_hash)).value());
  }

}  // namespace attesta::network

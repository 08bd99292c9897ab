/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <optional>
#include <vector>

#include <boost/assert.hpp>
#include <boost/variant.hpp>
#include <scale/bitvec.hpp>
#include <scale/scale.hpp>

#include "common/visitor.hpp"
#include "network/types/collator_messages.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace attesta::network::vstaging {

  struct SecondedCandidateHash {
    CandidateHash hash;
    bool operator==(const SecondedCandidateHash &other) const = default;
  };

  struct ValidCandidateHash {
    CandidateHash hash;
    bool operator==(const ValidCandidateHash &other) const = default;
  };

  /// Statements that can be made about parachain candidates. These are the
  /// actual values that are signed.
  struct CompactStatement {
    std::array<uint8_t, 4> header = {'B', 'K', 'N', 'G'};

    boost::variant<Empty,
                   /// Proposal of a parachain candidate.
                   SecondedCandidateHash,
                   /// Statement that a parachain candidate is valid.
                   ValidCandidateHash>
        inner_value{};

    CompactStatement(
        boost::variant<Empty, SecondedCandidateHash, ValidCandidateHash> &&val)
        : inner_value{std::move(val)} {}
    CompactStatement(ValidCandidateHash &&val) : inner_value{std::move(val)} {}
    CompactStatement(SecondedCandidateHash &&val)
        : inner_value{std::move(val)} {}
    CompactStatement() = default;

    bool operator==(const CompactStatement &r) const {
      return inner_value == r.inner_value;
    }
  };

  using SignedCompactStatement = parachain::IndexedAndSigned<CompactStatement>;

  enum StatementKind {
    Seconded,
    Valid,
  };

  /// Candidate hash the statement is about, none for a malformed `Empty`.
  inline std::optional<CandidateHash> candidateHash(
      const CompactStatement &val) {
    return visit_in_place(
        val.inner_value,
        [](const SecondedCandidateHash &v) -> std::optional<CandidateHash> {
          return v.hash;
        },
        [](const ValidCandidateHash &v) -> std::optional<CandidateHash> {
          return v.hash;
        },
        [](const Empty &) -> std::optional<CandidateHash> {
          return std::nullopt;
        });
  }

  inline std::optional<StatementKind> statementKind(
      const CompactStatement &val) {
    return visit_in_place(
        val.inner_value,
        [](const SecondedCandidateHash &) -> std::optional<StatementKind> {
          return StatementKind::Seconded;
        },
        [](const ValidCandidateHash &) -> std::optional<StatementKind> {
          return StatementKind::Valid;
        },
        [](const Empty &) -> std::optional<StatementKind> {
          return std::nullopt;
        });
  }

  /// A notification of a signed statement in compact form, for a given
  /// relay parent.
  struct StatementDistributionMessageStatement {
    RelayHash relay_parent;
    SignedCompactStatement compact;
  };

  struct StatementFilter {
    /// Seconded statements. '1' is known or undesired.
    scale::BitVec seconded_in_group;
    /// Valid statements. '1' is known or undesired.
    scale::BitVec validated_in_group;

    StatementFilter() = default;
    StatementFilter(size_t len, bool val = false) {
      seconded_in_group.bits.assign(len, val);
      validated_in_group.bits.assign(len, val);
    }

    bool operator==(const StatementFilter &other) const {
      return seconded_in_group.bits == other.seconded_in_group.bits
         and validated_in_group.bits == other.validated_in_group.bits;
    }

    bool has_len(size_t len) const {
      return seconded_in_group.bits.size() == len
         and validated_in_group.bits.size() == len;
    }

    bool contains(size_t index, StatementKind statement_kind) const {
      switch (statement_kind) {
        case StatementKind::Seconded:
          return index < seconded_in_group.bits.size()
             and seconded_in_group.bits[index];
        case StatementKind::Valid:
          return index < validated_in_group.bits.size()
             and validated_in_group.bits[index];
      }
      return false;
    }

    void set(size_t index, StatementKind statement_kind) {
      switch (statement_kind) {
        case StatementKind::Seconded:
          if (index < seconded_in_group.bits.size()) {
            seconded_in_group.bits[index] = true;
          }
          break;
        case StatementKind::Valid:
          if (index < validated_in_group.bits.size()) {
            validated_in_group.bits[index] = true;
          }
          break;
      }
    }

    /// Number of group members with at least one statement set.
    size_t backing_validators() const {
      BOOST_ASSERT(seconded_in_group.bits.size()
                   == validated_in_group.bits.size());

      size_t count = 0;
      for (size_t ix = 0; ix < seconded_in_group.bits.size(); ++ix) {
        const auto s = seconded_in_group.bits[ix];
        const auto v = validated_in_group.bits[ix];
        count += size_t(s || v);
      }
      return count;
    }

    /// True if `other` has some bit set which is unset here.
    bool lacks_any_of(const StatementFilter &other) const {
      for (size_t ix = 0; ix < seconded_in_group.bits.size(); ++ix) {
        if (other.contains(ix, StatementKind::Seconded)
            and not contains(ix, StatementKind::Seconded)) {
          return true;
        }
        if (other.contains(ix, StatementKind::Valid)
            and not contains(ix, StatementKind::Valid)) {
          return true;
        }
      }
      return false;
    }
  };

  /// A manifest of a known backed candidate, along with a description
  /// of the statements backing it.
  struct BackedCandidateManifest {
    /// The relay-parent of the candidate.
    RelayHash relay_parent;
    /// The hash of the candidate.
    CandidateHash candidate_hash;
    /// The group index backing the candidate at the relay-parent.
    GroupIndex group_index;
    /// The para ID of the candidate.
    ParachainId para_id;
    /// The head-data corresponding to the candidate.
    Hash parent_head_data_hash;
    /// A statement filter which indicates which validators in the
    /// para's group at the relay-parent have validated this candidate
    /// and issued statements about it, to the advertiser's knowledge.
    ///
    /// This MUST have exactly the minimum amount of bytes
    /// necessary to represent the number of validators in the assigned
    /// backing group as-of the relay-parent.
    StatementFilter statement_knowledge;
  };

  struct AttestedCandidateRequest {
    CandidateHash candidate_hash;
    StatementFilter mask;
  };

  struct AttestedCandidateResponse {
    CommittedCandidateReceipt candidate_receipt;
    runtime::PersistedValidationData persisted_validation_data;
    std::vector<SignedCompactStatement> statements;
  };

  /// An acknowledgement of a backed candidate being known.
  struct BackedCandidateAcknowledgement {
    /// The hash of the candidate.
    CandidateHash candidate_hash;
    /// A statement filter which indicates which validators in the
    /// para's group at the relay-parent have validated this candidate
    /// and issued statements about it, to the advertiser's knowledge.
    StatementFilter statement_knowledge;
  };

  /// Network messages used by the statement distribution subsystem.
  using StatementDistributionMessage = boost::variant<
      StatementDistributionMessageStatement,  // 0
      /// A notification of a backed candidate being known by the
      /// sending node, for the purpose of being requested by the
      /// receiving node if needed.
      BackedCandidateManifest,  // 1
      /// A notification of a backed candidate being known by the sending node,
      /// for the purpose of informing a receiving node which already has the
      /// candidate.
      BackedCandidateAcknowledgement  // 2
      >;

  // SCALE coders

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SecondedCandidateHash &v) {
    return s << v.hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SecondedCandidateHash &v) {
    return s >> v.hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ValidCandidateHash &v) {
    return s << v.hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ValidCandidateHash &v) {
    return s >> v.hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const CompactStatement &v) {
    return s << v.header << v.inner_value;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, CompactStatement &v) {
    return s >> v.header >> v.inner_value;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StatementDistributionMessageStatement &v) {
    return s << v.relay_parent << v.compact;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StatementDistributionMessageStatement &v) {
    return s >> v.relay_parent >> v.compact;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StatementFilter &v) {
    return s << v.seconded_in_group << v.validated_in_group;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StatementFilter &v) {
    return s >> v.seconded_in_group >> v.validated_in_group;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BackedCandidateManifest &v) {
    return s << v.relay_parent << v.candidate_hash << v.group_index
             << v.para_id << v.parent_head_data_hash << v.statement_knowledge;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BackedCandidateManifest &v) {
    return s >> v.relay_parent >> v.candidate_hash >> v.group_index
        >> v.para_id >> v.parent_head_data_hash >> v.statement_knowledge;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const AttestedCandidateRequest &v) {
    return s << v.candidate_hash << v.mask;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, AttestedCandidateRequest &v) {
    return s >> v.candidate_hash >> v.mask;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const AttestedCandidateResponse &v) {
    return s << v.candidate_receipt << v.persisted_validation_data
             << v.statements;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, AttestedCandidateResponse &v) {
    return s >> v.candidate_receipt >> v.persisted_validation_data
        >> v.statements;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BackedCandidateAcknowledgement &v) {
    return s << v.candidate_hash << v.statement_knowledge;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BackedCandidateAcknowledgement &v) {
    return s >> v.candidate_hash >> v.statement_knowledge;
  }

}  // namespace attesta::network::vstaging

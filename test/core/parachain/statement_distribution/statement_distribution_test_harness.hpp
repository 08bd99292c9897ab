/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <scale/scale.hpp>

#include "mock/core/crypto/hasher_mock.hpp"
#include "mock/core/crypto/sr25519_provider_mock.hpp"
#include "mock/core/network/peer_view_mock.hpp"
#include "mock/core/parachain/network_bridge_mock.hpp"
#include "network/types/collator_messages_vstaging.hpp"
#include "parachain/validator/signing_context.hpp"
#include "parachain/validator/statement_distribution/types.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

namespace network = attesta::network;
namespace runtime = attesta::runtime;
namespace common = attesta::common;
namespace crypto = attesta::crypto;

using attesta::parachain::CandidateHash;
using attesta::parachain::GroupIndex;
using attesta::parachain::NetworkBridgeMock;
using attesta::parachain::RelayHash;
using attesta::parachain::SigningContext;
using attesta::parachain::ValidatorId;
using attesta::parachain::ValidatorIndex;
using attesta::parachain::statement_distribution::PeerId;
using attesta::parachain::statement_distribution::SignedCompactStatement;
using attesta::parachain::statement_distribution::StatementFilter;
using attesta::parachain::statement_distribution::StatementKind;

using testing::_;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;

/// Deterministic stand-in for blake2b-256, distinct inputs give distinct
/// hashes for the small inputs used in tests.
inline common::Hash256 foldHash(common::BufferView data) {
  common::Hash256 hash{};
  uint64_t acc = 0xcbf29ce484222325ull ^ data.size();
  for (size_t i = 0; i < data.size(); ++i) {
    acc = (acc ^ data[i]) * 0x100000001b3ull;
    hash[i % hash.size()] ^= static_cast<uint8_t>(acc >> 24);
  }
  for (size_t i = 0; i < hash.size(); ++i) {
    acc = (acc ^ i) * 0x100000001b3ull;
    hash[i] ^= static_cast<uint8_t>(acc >> 32);
  }
  return hash;
}

/// Signature the provider mock treats as forged.
inline crypto::Sr25519Signature badSignature() {
  crypto::Sr25519Signature signature;
  signature.fill(0xff);
  return signature;
}

class StatementDistributionTestBase : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*hasher_, blake2b_256(_)).WillByDefault(Invoke(&foldHash));
    ON_CALL(*sr25519_provider_, verify(_, _, _))
        .WillByDefault(Invoke([](const crypto::Sr25519Signature &signature,
                                 common::BufferView,
                                 const crypto::Sr25519PublicKey &)
                                  -> outcome::result<bool> {
          return signature != badSignature();
        }));
  }

 protected:
  static ValidatorId validatorKey(ValidatorIndex index) {
    ValidatorId key;
    key.fill(static_cast<uint8_t>(index + 1));
    return key;
  }

  static std::vector<ValidatorId> validatorKeys(size_t count) {
    std::vector<ValidatorId> keys;
    for (ValidatorIndex ix = 0; ix < count; ++ix) {
      keys.emplace_back(validatorKey(ix));
    }
    return keys;
  }

  runtime::PersistedValidationData makePvd(uint32_t number) const {
    return runtime::PersistedValidationData{
        .parent_head = {1, 2, 3},
        .relay_parent_number = number,
        .relay_parent_storage_root = "storage_root"_hash256,
        .max_pov_size = 1024,
    };
  }

  network::CommittedCandidateReceipt makeReceipt(
      const RelayHash &relay_parent,
      uint32_t para_id,
      const runtime::PersistedValidationData &pvd) const {
    return network::CommittedCandidateReceipt{
        .descriptor =
            network::CandidateDescriptor{
                .para_id = para_id,
                .relay_parent = relay_parent,
                .persisted_data_hash =
                    foldHash(scale::encode(pvd).value()),
                .pov_hash = "pov"_hash256,
                .para_head_hash = "head"_hash256,
            },
        .commitments =
            network::CandidateCommitments{
                .para_head = {4, 5, 6},
                .watermark = para_id,
            },
    };
  }

  CandidateHash hashOf(const network::CommittedCandidateReceipt &receipt) {
    return network::candidateHash(*hasher_, receipt);
  }

  static SignedCompactStatement makeStatement(StatementKind kind,
                                              const CandidateHash &candidate,
                                              ValidatorIndex validator,
                                              bool forged = false) {
    network::vstaging::CompactStatement compact =
        kind == StatementKind::Seconded
            ? network::vstaging::CompactStatement{network::vstaging::
                                                      SecondedCandidateHash{
                                                          candidate}}
            : network::vstaging::CompactStatement{
                network::vstaging::ValidCandidateHash{candidate}};
    crypto::Sr25519Signature signature;
    signature.fill(static_cast<uint8_t>(validator));
    return SignedCompactStatement{
        .payload = {.payload = std::move(compact), .ix = validator},
        .signature = forged ? badSignature() : signature,
    };
  }

  static common::Buffer encodeResponse(
      const network::CommittedCandidateReceipt &receipt,
      const runtime::PersistedValidationData &pvd,
      std::vector<SignedCompactStatement> statements) {
    return scale::encode(network::vstaging::AttestedCandidateResponse{
                             .candidate_receipt = receipt,
                             .persisted_validation_data = pvd,
                             .statements = std::move(statements),
                         })
        .value();
  }

  static StatementFilter makeFilter(
      size_t len,
      std::initializer_list<std::pair<size_t, StatementKind>> bits) {
    StatementFilter filter(len);
    for (const auto &[index, kind] : bits) {
      filter.set(index, kind);
    }
    return filter;
  }

  std::shared_ptr<NiceMock<crypto::HasherMock>> hasher_ =
      std::make_shared<NiceMock<crypto::HasherMock>>();
  std::shared_ptr<NiceMock<crypto::Sr25519ProviderMock>> sr25519_provider_ =
      std::make_shared<NiceMock<crypto::Sr25519ProviderMock>>();

  const RelayHash relay_parent_ = "relay_parent"_hash256;

  const PeerId peer_a_ = "peer_a"_peerid;
  const PeerId peer_b_ = "peer_b"_peerid;
  const PeerId peer_c_ = "peer_c"_peerid;
  const PeerId peer_d_ = "peer_d"_peerid;
};

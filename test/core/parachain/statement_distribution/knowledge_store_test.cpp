/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/knowledge_store.hpp"

#include "core/parachain/statement_distribution/statement_distribution_test_harness.hpp"

using attesta::parachain::statement_distribution::CandidateKnowledgeState;
using attesta::parachain::statement_distribution::KnowledgeStore;
using attesta::parachain::statement_distribution::KnowledgeStoreError;

class KnowledgeStoreTest : public StatementDistributionTestBase {
 public:
  void SetUp() override {
    StatementDistributionTestBase::SetUp();
    store.note_candidate(candidate, 1, group);
  }

  std::vector<ValidatorIndex> group{4, 7, 9};
  const CandidateHash candidate = "candidate"_hash256;
  const CandidateHash other_candidate = "other"_hash256;
  KnowledgeStore store;
};

/**
 * @given registered candidate
 * @when the same statement is recorded several times
 * @then mask is the same as after recording it once
 */
TEST_F(KnowledgeStoreTest, RecordLocalIsIdempotent) {
  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 7, StatementKind::Seconded));
  ASSERT_OUTCOME_SUCCESS(once, store.mask_for(candidate));

  for (auto i = 0; i < 3; ++i) {
    ASSERT_OUTCOME_SUCCESS_TRY(
        store.record_local(candidate, 7, StatementKind::Seconded));
  }
  ASSERT_OUTCOME_SUCCESS(repeated, store.mask_for(candidate));

  EXPECT_EQ(once, repeated);
  EXPECT_EQ(repeated, makeFilter(3, {{1, StatementKind::Seconded}}));
}

TEST_F(KnowledgeStoreTest, MaskIsSnapshotAndMonotonic) {
  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 4, StatementKind::Seconded));
  ASSERT_OUTCOME_SUCCESS(snapshot, store.mask_for(candidate));

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 9, StatementKind::Valid));
  EXPECT_EQ(snapshot, makeFilter(3, {{0, StatementKind::Seconded}}));

  ASSERT_OUTCOME_SUCCESS(later, store.mask_for(candidate));
  EXPECT_TRUE(snapshot.lacks_any_of(later));
  EXPECT_FALSE(later.lacks_any_of(snapshot));
}

TEST_F(KnowledgeStoreTest, RejectsUnknownCandidateAndForeignValidator) {
  EXPECT_EC(store.record_local(other_candidate, 4, StatementKind::Seconded),
            KnowledgeStoreError::UNKNOWN_CANDIDATE);
  EXPECT_EC(store.record_local(candidate, 5, StatementKind::Seconded),
            KnowledgeStoreError::VALIDATOR_NOT_IN_GROUP);
  EXPECT_EC(
      store.record_peer(peer_a_, candidate, 100, StatementKind::Valid),
      KnowledgeStoreError::VALIDATOR_NOT_IN_GROUP);
  EXPECT_EC(store.mask_for(other_candidate),
            KnowledgeStoreError::UNKNOWN_CANDIDATE);
}

TEST_F(KnowledgeStoreTest, TracksPeerKnowledgeSeparately) {
  EXPECT_FALSE(
      store.is_known_by_peer(peer_a_, candidate, 7, StatementKind::Seconded));

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_peer(peer_a_, candidate, 7, StatementKind::Seconded));
  EXPECT_TRUE(
      store.is_known_by_peer(peer_a_, candidate, 7, StatementKind::Seconded));
  EXPECT_FALSE(
      store.was_received_from(peer_a_, candidate, 7, StatementKind::Seconded));
  EXPECT_FALSE(
      store.is_known_by_peer(peer_b_, candidate, 7, StatementKind::Seconded));
  EXPECT_FALSE(
      store.is_known_by_peer(peer_a_, candidate, 7, StatementKind::Valid));

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_received(peer_b_, candidate, 9, StatementKind::Valid));
  EXPECT_TRUE(
      store.is_known_by_peer(peer_b_, candidate, 9, StatementKind::Valid));
  EXPECT_TRUE(
      store.was_received_from(peer_b_, candidate, 9, StatementKind::Valid));

  // peer knowledge does not leak into local knowledge
  EXPECT_FALSE(store.is_known_locally(candidate, 9, StatementKind::Valid));
}

TEST_F(KnowledgeStoreTest, RecordsManifestFilter) {
  auto filter = makeFilter(
      3, {{0, StatementKind::Seconded}, {2, StatementKind::Valid}});
  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_received_filter(peer_c_, candidate, filter));

  EXPECT_TRUE(
      store.was_received_from(peer_c_, candidate, 4, StatementKind::Seconded));
  EXPECT_TRUE(
      store.was_received_from(peer_c_, candidate, 9, StatementKind::Valid));
  EXPECT_FALSE(
      store.was_received_from(peer_c_, candidate, 7, StatementKind::Seconded));
}

/**
 * @given peer advertising statements of validators 4 and 9
 * @when only some of them become known locally
 * @then the peer is still holding statements we lack until all are known
 */
TEST_F(KnowledgeStoreTest, TracksAdvertisedButUnknownStatements) {
  EXPECT_FALSE(store.lacks_claimed_by(peer_c_, candidate));
  ASSERT_OUTCOME_SUCCESS_TRY(store.record_received_filter(
      peer_c_,
      candidate,
      makeFilter(3,
                 {{0, StatementKind::Seconded}, {2, StatementKind::Valid}})));
  EXPECT_TRUE(store.lacks_claimed_by(peer_c_, candidate));

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 4, StatementKind::Seconded));
  EXPECT_TRUE(store.lacks_claimed_by(peer_c_, candidate));

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 9, StatementKind::Valid));
  EXPECT_FALSE(store.lacks_claimed_by(peer_c_, candidate));
  EXPECT_FALSE(store.lacks_claimed_by(peer_a_, candidate));
  EXPECT_FALSE(store.lacks_claimed_by(peer_c_, other_candidate));
}

TEST_F(KnowledgeStoreTest, StoreStatementReportsFirstSighting) {
  auto seconded = makeStatement(StatementKind::Seconded, candidate, 4);

  ASSERT_OUTCOME_SUCCESS(first, store.store_statement(candidate, seconded));
  EXPECT_TRUE(first);
  ASSERT_OUTCOME_SUCCESS(second, store.store_statement(candidate, seconded));
  EXPECT_FALSE(second);

  EXPECT_TRUE(store.is_known_locally(candidate, 4, StatementKind::Seconded));
  EXPECT_EQ(store.statements_for(candidate, StatementFilter(3)).size(), 1u);
}

TEST_F(KnowledgeStoreTest, KnowledgeStateFollowsGroupCoverage) {
  EXPECT_EQ(store.knowledge_state(other_candidate),
            CandidateKnowledgeState::kUnknown);
  EXPECT_EQ(store.knowledge_state(candidate),
            CandidateKnowledgeState::kUnknown);

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 4, StatementKind::Seconded));
  EXPECT_EQ(store.knowledge_state(candidate),
            CandidateKnowledgeState::kPartiallyKnown);

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 7, StatementKind::Valid));
  EXPECT_EQ(store.knowledge_state(candidate),
            CandidateKnowledgeState::kPartiallyKnown);

  ASSERT_OUTCOME_SUCCESS_TRY(
      store.record_local(candidate, 9, StatementKind::Valid));
  EXPECT_EQ(store.knowledge_state(candidate),
            CandidateKnowledgeState::kFullyKnown);
}

/**
 * @given statements of every group member stored in mixed order
 * @when statements are selected against a mask
 * @then masked ones are skipped and seconded statements come first
 */
TEST_F(KnowledgeStoreTest, StatementsForRespectsMask) {
  auto valid_9 = makeStatement(StatementKind::Valid, candidate, 9);
  auto seconded_4 = makeStatement(StatementKind::Seconded, candidate, 4);
  auto valid_7 = makeStatement(StatementKind::Valid, candidate, 7);
  for (const auto &statement : {valid_9, seconded_4, valid_7}) {
    ASSERT_OUTCOME_SUCCESS_TRY(store.store_statement(candidate, statement));
  }

  auto all = store.statements_for(candidate, StatementFilter(3));
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0], seconded_4);
  EXPECT_EQ(all[1], valid_9);
  EXPECT_EQ(all[2], valid_7);

  auto masked = store.statements_for(
      candidate, makeFilter(3, {{2, StatementKind::Valid}}));
  ASSERT_EQ(masked.size(), 2u);
  EXPECT_EQ(masked[0], seconded_4);
  EXPECT_EQ(masked[1], valid_7);
}

TEST_F(KnowledgeStoreTest, ConfirmKeepsFirstReceipt) {
  EXPECT_FALSE(store.confirmed(candidate));

  auto pvd = makePvd(1);
  auto receipt = makeReceipt(relay_parent_, 100, pvd);
  store.confirm(candidate, receipt, pvd);
  store.confirm(candidate, makeReceipt(relay_parent_, 200, pvd), pvd);

  auto confirmed = store.confirmed(candidate);
  ASSERT_TRUE(confirmed);
  EXPECT_EQ(confirmed->get().receipt, receipt);
  EXPECT_EQ(confirmed->get().persisted_validation_data, pvd);
}

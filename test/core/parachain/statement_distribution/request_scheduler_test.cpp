/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/request_scheduler.hpp"

#include "core/parachain/statement_distribution/statement_distribution_test_harness.hpp"

using attesta::parachain::IfDisconnected;
using attesta::parachain::NetworkBridge;
using attesta::parachain::statement_distribution::Clock;
using attesta::parachain::statement_distribution::KnowledgeStore;
using attesta::parachain::statement_distribution::RequestPolicy;
using attesta::parachain::statement_distribution::RequestId;
using attesta::parachain::statement_distribution::RequestReason;
using attesta::parachain::statement_distribution::RequestScheduler;
using attesta::parachain::statement_distribution::RetryDecision;
using attesta::parachain::statement_distribution::StatementDistributionError;
using testing::SaveArg;

class RequestSchedulerTest : public StatementDistributionTestBase {
 public:
  void SetUp() override {
    StatementDistributionTestBase::SetUp();
    knowledge.note_candidate(candidate, 0, {0, 1, 2});
    ASSERT_OUTCOME_SUCCESS_TRY(
        knowledge.record_local(candidate, 1, StatementKind::Seconded));

    ON_CALL(*peer_view_, peerHasRelayParent(_, relay_parent_))
        .WillByDefault(Return(true));
    ON_CALL(*network_bridge_, send_attested_candidate_request(_, _, _, _))
        .WillByDefault(Return(outcome::success()));
  }

  RequestScheduler makeScheduler(uint32_t retries, bool other_peer) {
    return RequestScheduler{relay_parent_,
                            RequestPolicy{
                                .request_timeout = timeout,
                                .max_request_retries = retries,
                                .retry_with_other_peer = other_peer,
                            },
                            peer_view_,
                            network_bridge_};
  }

  outcome::result<void> request(RequestScheduler &scheduler,
                                const PeerId &peer,
                                uint32_t attempt = 0) {
    return scheduler.maybe_request(knowledge,
                                   candidate,
                                   peer,
                                   RequestReason::kGapFill,
                                   now,
                                   [](RequestId,
                                      outcome::result<common::Buffer>) {},
                                   attempt);
  }

  std::shared_ptr<NiceMock<network::PeerViewMock>> peer_view_ =
      std::make_shared<NiceMock<network::PeerViewMock>>();
  std::shared_ptr<NiceMock<NetworkBridgeMock>> network_bridge_ =
      std::make_shared<NiceMock<NetworkBridgeMock>>();

  const CandidateHash candidate = "candidate"_hash256;
  const std::chrono::milliseconds timeout{500};
  const Clock::time_point now = Clock::now();
  KnowledgeStore knowledge;
};

/**
 * @given incomplete knowledge and a peer having the relay parent in view
 * @when request is made
 * @then it carries the current mask and fails fast on disconnected peer
 */
TEST_F(RequestSchedulerTest, SendsMaskSnapshot) {
  auto scheduler = makeScheduler(0, false);
  network::vstaging::AttestedCandidateRequest sent;
  EXPECT_CALL(*network_bridge_,
              send_attested_candidate_request(
                  peer_a_, _, IfDisconnected::kImmediateError, _))
      .WillOnce(testing::DoAll(SaveArg<1>(&sent), Return(outcome::success())));

  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
  EXPECT_EQ(sent.candidate_hash, candidate);
  EXPECT_EQ(sent.mask, makeFilter(3, {{1, StatementKind::Seconded}}));

  // knowledge learned afterwards does not change the outstanding mask
  ASSERT_OUTCOME_SUCCESS_TRY(
      knowledge.record_local(candidate, 2, StatementKind::Valid));
  auto outstanding = scheduler.take(peer_a_, candidate, 0);
  ASSERT_TRUE(outstanding);
  EXPECT_EQ(outstanding->id, 0u);
  EXPECT_EQ(outstanding->mask, makeFilter(3, {{1, StatementKind::Seconded}}));
  EXPECT_EQ(outstanding->deadline, now + timeout);
  EXPECT_EQ(outstanding->reason, RequestReason::kGapFill);
}

TEST_F(RequestSchedulerTest, AtMostOneOutstandingPerPeerAndCandidate) {
  auto scheduler = makeScheduler(0, false);
  EXPECT_CALL(*network_bridge_,
              send_attested_candidate_request(peer_a_, _, _, _))
      .Times(1);
  EXPECT_CALL(*network_bridge_,
              send_attested_candidate_request(peer_b_, _, _, _))
      .Times(1);

  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
  EXPECT_EC(request(scheduler, peer_a_),
            StatementDistributionError::REQUEST_ALREADY_OUTSTANDING);
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_b_));
  EXPECT_EQ(scheduler.outstanding_count(), 2);
}

TEST_F(RequestSchedulerTest, SkipsPeerWithoutRelayParent) {
  auto scheduler = makeScheduler(0, false);
  EXPECT_CALL(*peer_view_, peerHasRelayParent(peer_c_, relay_parent_))
      .WillOnce(Return(false));
  EXPECT_CALL(*network_bridge_, send_attested_candidate_request(_, _, _, _))
      .Times(0);

  EXPECT_EC(request(scheduler, peer_c_),
            StatementDistributionError::PEER_NOT_IN_VIEW);
  EXPECT_FALSE(scheduler.is_outstanding(peer_c_, candidate));
}

TEST_F(RequestSchedulerTest, SkipsCompleteKnowledge) {
  auto scheduler = makeScheduler(0, false);
  ASSERT_OUTCOME_SUCCESS_TRY(
      knowledge.record_local(candidate, 0, StatementKind::Seconded));
  ASSERT_OUTCOME_SUCCESS_TRY(
      knowledge.record_local(candidate, 2, StatementKind::Valid));
  EXPECT_CALL(*network_bridge_, send_attested_candidate_request(_, _, _, _))
      .Times(0);

  EXPECT_EC(request(scheduler, peer_a_),
            StatementDistributionError::KNOWLEDGE_COMPLETE);
}

TEST_F(RequestSchedulerTest, FailedSendClearsEntry) {
  auto scheduler = makeScheduler(0, false);
  EXPECT_CALL(*network_bridge_,
              send_attested_candidate_request(peer_a_, _, _, _))
      .WillOnce(Return(
          outcome::failure(StatementDistributionError::PEER_NOT_IN_VIEW)))
      .WillOnce(Return(outcome::success()));

  EXPECT_EC(request(scheduler, peer_a_),
            StatementDistributionError::PEER_NOT_IN_VIEW);
  EXPECT_FALSE(scheduler.is_outstanding(peer_a_, candidate));
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
}

TEST_F(RequestSchedulerTest, ExpiresAfterDeadline) {
  auto scheduler = makeScheduler(0, false);
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));

  EXPECT_TRUE(scheduler.expire(now + timeout / 2).empty());
  auto expired = scheduler.expire(now + timeout);
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0].first, peer_a_);
  EXPECT_EQ(expired[0].second, candidate);
}

TEST_F(RequestSchedulerTest, TimeoutRetriesUntilExhausted) {
  using Action = RetryDecision::Action;
  auto scheduler = makeScheduler(1, true);

  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
  auto first = scheduler.on_timeout(peer_a_, candidate);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->action, Action::kRetryOtherPeer);
  EXPECT_EQ(first->next_attempt, 1);
  EXPECT_FALSE(scheduler.is_outstanding(peer_a_, candidate));

  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_b_, first->next_attempt));
  auto second = scheduler.on_timeout(peer_b_, candidate);
  ASSERT_TRUE(second);
  EXPECT_EQ(second->action, Action::kGiveUp);

  EXPECT_FALSE(scheduler.on_timeout(peer_b_, candidate));
}

TEST_F(RequestSchedulerTest, TimeoutRetriesSamePeerWhenConfigured) {
  auto scheduler = makeScheduler(3, false);
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
  auto decision = scheduler.on_timeout(peer_a_, candidate);
  ASSERT_TRUE(decision);
  EXPECT_EQ(decision->action, RetryDecision::Action::kRetrySamePeer);
  EXPECT_EQ(decision->peer, peer_a_);
}

TEST_F(RequestSchedulerTest, CancelAllDropsOutstanding) {
  auto scheduler = makeScheduler(0, false);
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_a_));
  ASSERT_OUTCOME_SUCCESS_TRY(request(scheduler, peer_b_));

  scheduler.cancel_all();
  EXPECT_EQ(scheduler.outstanding_count(), 0);
  EXPECT_FALSE(scheduler.take(peer_a_, candidate, 0));
}

/**
 * @given request to A which timed out and a newer request to A
 * @when the response to the first request arrives
 * @then it matches nothing and the newer request stays outstanding
 */
TEST_F(RequestSchedulerTest, ResponseMatchesOnlyItsOwnRequest) {
  auto scheduler = makeScheduler(2, true);
  std::vector<NetworkBridge::ResponseHandler> handlers;
  ON_CALL(*network_bridge_, send_attested_candidate_request(_, _, _, _))
      .WillByDefault(Invoke([&](const PeerId &,
                                const network::vstaging::AttestedCandidateRequest &,
                                IfDisconnected,
                                NetworkBridge::ResponseHandler handler)
                                -> outcome::result<void> {
        handlers.emplace_back(std::move(handler));
        return outcome::success();
      }));
  std::vector<RequestId> answered;
  auto request_a = [&] {
    return scheduler.maybe_request(
        knowledge,
        candidate,
        peer_a_,
        RequestReason::kGapFill,
        now,
        [&](RequestId id, outcome::result<common::Buffer>) {
          answered.emplace_back(id);
        });
  };

  ASSERT_OUTCOME_SUCCESS_TRY(request_a());
  ASSERT_TRUE(scheduler.on_timeout(peer_a_, candidate));
  ASSERT_OUTCOME_SUCCESS_TRY(request_a());
  ASSERT_EQ(handlers.size(), 2u);

  handlers[0](common::Buffer{});
  ASSERT_EQ(answered.size(), 1u);
  EXPECT_FALSE(scheduler.take(peer_a_, candidate, answered[0]));
  EXPECT_TRUE(scheduler.is_outstanding(peer_a_, candidate));

  handlers[1](common::Buffer{});
  ASSERT_EQ(answered.size(), 2u);
  EXPECT_NE(answered[1], answered[0]);
  EXPECT_TRUE(scheduler.take(peer_a_, candidate, answered[1]));
  EXPECT_FALSE(scheduler.is_outstanding(peer_a_, candidate));
}

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/impl/multi_adapter_impl.hpp"

#include <algorithm>
#include <set>

#include <gtest/gtest.h>
#include "auth/access_control.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"
#include "logger/logger_manager.hpp"
#include "messages/impl/tagged_message_properties.hpp"
#include "module/courier/adapter/mock_adapter.hpp"
#include "module/courier/multi_adapter/mock_batch_handler.hpp"
#include "wire/batch_codec.hpp"

using namespace courier;
using namespace courier::multi_adapter;
using courier::adapter::AdapterReceipt;
using courier::adapter::MockAdapter;
using courier::messages::TaggedMessageProperties;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class MultiAdapterTest : public ::testing::Test {
 public:
  static constexpr types::NetworkId kLocal = 1;
  static constexpr types::NetworkId kRemote = 2;
  static constexpr types::GasLimit kGas = 100;
  const types::AccountId kAdmin = "admin";
  const types::AccountId kOperator = "ops";
  const types::AccountId kRefund = "refund";

  void SetUp() override {
    access_control = std::make_shared<auth::AccessControl>(
        std::vector<types::AccountId>{kAdmin},
        std::vector<types::AccountId>{kOperator},
        getTestLogger("AccessControl"));
    router = std::make_shared<MultiAdapterImpl>(
        kLocal,
        access_control,
        std::make_shared<TaggedMessageProperties>(
            kGas, std::map<uint8_t, types::GasLimit>{}),
        getTestLoggerManager()->getChild("MultiAdapter"));
    handler = std::make_shared<MockBatchHandler>();
    router->setBatchHandler(handler);

    for (const auto &id : {"a", "b", "c"}) {
      auto adapter = std::make_shared<NiceMock<MockAdapter>>(id);
      ON_CALL(*adapter, estimate(_, _, _)).WillByDefault(Return(10));
      ON_CALL(*adapter, send(_, _, _, _))
          .WillByDefault(Return(expected::makeValue(
              AdapterReceipt{id, std::string{"ref-"} + id})));
      adapters.push_back(adapter);
    }
    messages = {TaggedMessageProperties::makeMessage(1, 0, {0x01}),
                TaggedMessageProperties::makeMessage(1, 0, {0x02})};
    batch = wire::pack(messages).assumeValue();
    hash = wire::batchHash(batch);
    proof = wire::packProof(hash);
  }

  /// a, b, c all sending, two votes needed
  void fileQuorumOfTwo(types::TenantId tenant = types::kGlobalTenant) {
    COURIER_ASSERT_RESULT_VALUE(router->file(kAdmin,
                                             kRemote,
                                             tenant,
                                             {adapters.begin(), adapters.end()},
                                             2,
                                             0,
                                             3));
  }

  InboundOutcome deliver(const types::Bytes &frame, const std::string &by) {
    auto outcome = router->handle(kRemote, frame, by);
    EXPECT_TRUE(expected::hasValue(outcome));
    return outcome.assumeValue();
  }

  std::shared_ptr<auth::AccessControl> access_control;
  std::shared_ptr<MultiAdapterImpl> router;
  std::shared_ptr<MockBatchHandler> handler;
  std::vector<std::shared_ptr<NiceMock<MockAdapter>>> adapters;
  std::vector<types::Bytes> messages;
  types::Bytes batch;
  hash256_t hash;
  types::Bytes proof;
};

/**
 * @given three sending adapters with the first one primary
 * @when a batch is sent with enough payment
 * @then the primary carries the batch, the others carry the proof, and the
 * cost is the sum of the estimates
 */
TEST_F(MultiAdapterTest, SendBatchAndProofs) {
  fileQuorumOfTwo();
  EXPECT_CALL(*adapters[0], send(kRemote, batch, kGas, kRefund));
  EXPECT_CALL(*adapters[1], send(kRemote, proof, kGas, kRefund));
  EXPECT_CALL(*adapters[2], send(kRemote, proof, kGas, kRefund));

  auto estimate = router->estimate(kRemote, 0, batch, kGas);
  COURIER_ASSERT_RESULT_VALUE(estimate);
  EXPECT_EQ(estimate.assumeValue(), 30);

  auto receipt = router->send(kRemote, 0, batch, kGas, 30, kRefund);
  COURIER_ASSERT_RESULT_VALUE(receipt);
  EXPECT_EQ(receipt.assumeValue().hash, hash);
  EXPECT_EQ(receipt.assumeValue().cost, 30);
  ASSERT_EQ(receipt.assumeValue().receipts.size(), 3);
  EXPECT_EQ(receipt.assumeValue().receipts[2].reference, "ref-c");
}

/**
 * @given a setup with a receive-only adapter
 * @when a batch is sent
 * @then the receive-only adapter is neither quoted nor used
 */
TEST_F(MultiAdapterTest, ReceiveOnlyAdapterDoesNotSend) {
  COURIER_ASSERT_RESULT_VALUE(router->file(
      kAdmin, kRemote, 0, {adapters.begin(), adapters.end()}, 1, 1, 2));
  EXPECT_CALL(*adapters[0], send(kRemote, proof, kGas, kRefund));
  EXPECT_CALL(*adapters[1], send(kRemote, batch, kGas, kRefund));
  EXPECT_CALL(*adapters[2], estimate(_, _, _)).Times(0);
  EXPECT_CALL(*adapters[2], send(_, _, _, _)).Times(0);

  auto receipt = router->send(kRemote, 0, batch, kGas, 25, kRefund);
  COURIER_ASSERT_RESULT_VALUE(receipt);
  EXPECT_EQ(receipt.assumeValue().cost, 20);
}

/**
 * @given a filed route
 * @when sends are attempted with low payment, a malformed batch or to an
 * unknown network
 * @then each is refused before any adapter sends
 */
TEST_F(MultiAdapterTest, SendRefusals) {
  fileQuorumOfTwo();
  for (auto &adapter : adapters) {
    EXPECT_CALL(*adapter, send(_, _, _, _)).Times(0);
  }
  COURIER_ASSERT_ERROR_CODE(router->send(kRemote, 0, batch, kGas, 29, kRefund),
                            RouterError::Code::kInsufficientPayment);
  COURIER_ASSERT_ERROR_CODE(router->send(kRemote, 0, proof, kGas, 30, kRefund),
                            RouterError::Code::kMalformedFrame);
  COURIER_ASSERT_ERROR_CODE(router->send(9, 0, batch, kGas, 30, kRefund),
                            RouterError::Code::kUnknownDestination);
  COURIER_ASSERT_ERROR_CODE(router->estimate(9, 0, batch, kGas),
                            RouterError::Code::kUnknownDestination);
}

/**
 * @given estimates that do not fit the amount type together
 * @when a batch is quoted
 * @then overflow is reported
 */
TEST_F(MultiAdapterTest, EstimateOverflow) {
  fileQuorumOfTwo();
  ON_CALL(*adapters[1], estimate(_, _, _))
      .WillByDefault(Return(std::numeric_limits<types::Amount>::max()));
  COURIER_ASSERT_ERROR_CODE(router->estimate(kRemote, 0, batch, kGas),
                            RouterError::Code::kOverflow);
}

/**
 * @given the primary adapter fails to send
 * @when a batch is sent
 * @then the send fails as a whole and no proof goes out
 */
TEST_F(MultiAdapterTest, PrimaryFailure) {
  fileQuorumOfTwo();
  EXPECT_CALL(*adapters[0], send(_, _, _, _))
      .WillOnce(Return(expected::makeError(std::string{"unreachable"})));
  EXPECT_CALL(*adapters[1], send(_, _, _, _)).Times(0);
  EXPECT_CALL(*adapters[2], send(_, _, _, _)).Times(0);
  COURIER_ASSERT_ERROR_CODE(router->send(kRemote, 0, batch, kGas, 30, kRefund),
                            RouterError::Code::kAdapterFailure);
}

/**
 * @given a proof adapter fails after the primary carried the batch
 * @when a batch is sent
 * @then the send succeeds, the failed adapter is listed, the remaining proof
 * adapters still send and the whole quote is charged
 */
TEST_F(MultiAdapterTest, ProofFailureAfterBatchIsSent) {
  fileQuorumOfTwo();
  EXPECT_CALL(*adapters[0], send(kRemote, batch, _, _));
  EXPECT_CALL(*adapters[1], send(_, _, _, _))
      .WillOnce(Return(expected::makeError(std::string{"unreachable"})));
  EXPECT_CALL(*adapters[2], send(kRemote, proof, _, _));

  auto receipt = router->send(kRemote, 0, batch, kGas, 30, kRefund);
  COURIER_ASSERT_RESULT_VALUE(receipt);
  EXPECT_EQ(receipt.assumeValue().cost, 30);
  ASSERT_EQ(receipt.assumeValue().receipts.size(), 2);
  EXPECT_EQ(receipt.assumeValue().receipts[0].adapter, "a");
  EXPECT_EQ(receipt.assumeValue().receipts[1].adapter, "c");
  EXPECT_EQ(receipt.assumeValue().failed, std::vector<types::AdapterId>{"b"});
}

/**
 * @given a batch mixing messages of two tenants
 * @when it is sent
 * @then it is refused before any adapter sends
 */
TEST_F(MultiAdapterTest, MixedTenantBatchNotSent) {
  fileQuorumOfTwo();
  for (auto &adapter : adapters) {
    EXPECT_CALL(*adapter, send(_, _, _, _)).Times(0);
  }
  auto mixed = wire::pack({TaggedMessageProperties::makeMessage(1, 0, {0x01}),
                           TaggedMessageProperties::makeMessage(1, 5, {0x02})})
                   .assumeValue();
  COURIER_ASSERT_ERROR_CODE(router->send(kRemote, 0, mixed, kGas, 30, kRefund),
                            RouterError::Code::kMalformedFrame);
}

/**
 * @given a caller without the configurator role
 * @when it files or unfiles a route
 * @then it is refused, and unfiling an absent route is reported
 */
TEST_F(MultiAdapterTest, FilingNeedsConfigurator) {
  COURIER_ASSERT_ERROR_CODE(
      router->file(kOperator,
                   kRemote,
                   0,
                   {adapters.begin(), adapters.end()},
                   2,
                   0,
                   3),
      RouterError::Code::kUnauthorized);
  EXPECT_EQ(router->setup(kRemote, 0), nullptr);

  fileQuorumOfTwo();
  COURIER_ASSERT_ERROR_CODE(router->unfile(kOperator, kRemote, 0),
                            RouterError::Code::kUnauthorized);
  COURIER_ASSERT_RESULT_VALUE(router->unfile(kAdmin, kRemote, 0));
  COURIER_ASSERT_ERROR_CODE(router->unfile(kAdmin, kRemote, 0),
                            RouterError::Code::kUnknownDestination);
}

/**
 * @given quorum of two out of three adapters
 * @when the batch arrives via a and the proof via b, then the proof via c
 * @then the batch is handed over exactly once after the second vote
 */
TEST_F(MultiAdapterTest, QuorumDeliversOnce) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));

  auto first = deliver(batch, "a");
  EXPECT_EQ(first.status, InboundStatus::kPendingQuorum);
  EXPECT_EQ(first.votes, 1);

  auto second = deliver(proof, "b");
  EXPECT_EQ(second.status, InboundStatus::kDelivered);
  EXPECT_EQ(second.hash, hash);

  auto third = deliver(proof, "c");
  EXPECT_EQ(third.status, InboundStatus::kAlreadyDelivered);
  EXPECT_TRUE(router->pendingHashes(kRemote).empty());
}

/**
 * @given quorum of two
 * @when the proof arrives via b, then the batch via a, then the proof via c
 * @then the batch is delivered on the batch report and the late proof
 * changes nothing
 */
TEST_F(MultiAdapterTest, LateProofAfterDelivery) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));

  EXPECT_EQ(deliver(proof, "b").status, InboundStatus::kAwaitingPayload);
  auto delivered = deliver(batch, "a");
  EXPECT_EQ(delivered.status, InboundStatus::kDelivered);
  EXPECT_EQ(delivered.votes, 2);

  auto late = deliver(proof, "c");
  EXPECT_EQ(late.status, InboundStatus::kAlreadyDelivered);
  EXPECT_FALSE(late.duplicate_vote);
  EXPECT_EQ(router->voteState(kRemote, hash)->voters,
            (std::vector<types::AdapterId>{"a", "b"}));
}

/**
 * @given quorum of two
 * @when both proofs arrive before the batch
 * @then delivery happens when the batch arrives, with all three votes
 */
TEST_F(MultiAdapterTest, ProofsBeforeBatch) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));

  auto first = deliver(proof, "b");
  EXPECT_EQ(first.status, InboundStatus::kAwaitingPayload);
  auto second = deliver(proof, "c");
  EXPECT_EQ(second.status, InboundStatus::kAwaitingPayload);
  EXPECT_EQ(second.votes, 2);

  auto state = router->voteState(kRemote, hash);
  ASSERT_TRUE(state);
  EXPECT_FALSE(state->payload_held);

  auto third = deliver(batch, "a");
  EXPECT_EQ(third.status, InboundStatus::kDelivered);
  EXPECT_EQ(third.votes, 3);
}

/**
 * @given quorum of two
 * @when the same adapter reports the batch twice
 * @then the second report does not count
 */
TEST_F(MultiAdapterTest, DuplicateVoteIgnored) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(_, _)).Times(0);

  deliver(batch, "a");
  auto again = deliver(batch, "a");
  EXPECT_TRUE(again.duplicate_vote);
  EXPECT_EQ(again.status, InboundStatus::kPendingQuorum);
  EXPECT_EQ(again.votes, 1);
  EXPECT_EQ(router->pendingHashes(kRemote), std::vector<hash256_t>{hash});
}

/**
 * @given the global setup a, b, c and a tenant setup with adapter d
 * @when a global tenant batch is voted by a and d
 * @then the vote of d does not count towards the global setup
 */
TEST_F(MultiAdapterTest, OnlyMembersCount) {
  fileQuorumOfTwo();
  auto d = std::make_shared<NiceMock<MockAdapter>>("d");
  COURIER_ASSERT_RESULT_VALUE(router->file(kAdmin, kRemote, 77, {d}, 1, 0, 1));
  EXPECT_CALL(*handler, handleBatch(_, _)).Times(0);

  deliver(batch, "a");
  auto outcome = deliver(proof, "d");
  EXPECT_EQ(outcome.status, InboundStatus::kPendingQuorum);
  EXPECT_EQ(outcome.votes, 1);
}

/**
 * @given a batch of a tenant with its own setup
 * @when it is reported
 * @then the tenant setup threshold applies
 */
TEST_F(MultiAdapterTest, TenantSetupApplies) {
  fileQuorumOfTwo();
  auto d = std::make_shared<NiceMock<MockAdapter>>("d");
  COURIER_ASSERT_RESULT_VALUE(router->file(kAdmin, kRemote, 77, {d}, 1, 0, 1));
  std::vector<types::Bytes> tenant_messages{
      TaggedMessageProperties::makeMessage(3, 77, {0x09})};
  auto tenant_batch = wire::pack(tenant_messages).assumeValue();
  EXPECT_CALL(*handler, handleBatch(kRemote, tenant_messages))
      .WillOnce(Return(DispatchReport{1, 0}));

  EXPECT_EQ(deliver(tenant_batch, "d").status, InboundStatus::kDelivered);
}

/**
 * @given all of a, b and c needed for the global tenant and a tenant setup
 * where x alone suffices
 * @when x reports a batch whose first message belongs to that tenant and
 * whose second belongs to the global tenant
 * @then the batch is refused, no vote is recorded and nothing is handed over
 */
TEST_F(MultiAdapterTest, MixedTenantBatchRefused) {
  COURIER_ASSERT_RESULT_VALUE(router->file(
      kAdmin, kRemote, 0, {adapters.begin(), adapters.end()}, 3, 0, 3));
  auto x = std::make_shared<NiceMock<MockAdapter>>("x");
  COURIER_ASSERT_RESULT_VALUE(router->file(kAdmin, kRemote, 5, {x}, 1, 0, 1));
  auto mixed = wire::pack({TaggedMessageProperties::makeMessage(1, 5, {0x01}),
                           TaggedMessageProperties::makeMessage(1, 0, {0x02})})
                   .assumeValue();
  EXPECT_CALL(*handler, handleBatch(_, _)).Times(0);

  COURIER_ASSERT_ERROR_CODE(router->handle(kRemote, mixed, "x"),
                            RouterError::Code::kMalformedFrame);
  COURIER_ASSERT_ERROR_CODE(router->recover(kOperator, kRemote, mixed),
                            RouterError::Code::kMalformedFrame);
  EXPECT_FALSE(router->voteState(kRemote, wire::batchHash(mixed)));
  EXPECT_TRUE(router->pendingHashes(kRemote).empty());
}

/**
 * @given a batch whose payload carrier is stuck while both proofs arrived
 * @when an operator supplies the batch bytes
 * @then the batch is delivered, while a non-operator is refused
 */
TEST_F(MultiAdapterTest, StuckBatchRecovered) {
  fileQuorumOfTwo();
  deliver(proof, "b");
  deliver(proof, "c");
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));

  COURIER_ASSERT_ERROR_CODE(router->recover(kAdmin, kRemote, batch),
                            RouterError::Code::kUnauthorized);
  COURIER_ASSERT_ERROR_CODE(router->recover(kOperator, kRemote, proof),
                            RouterError::Code::kMalformedFrame);

  auto recovered = router->recover(kOperator, kRemote, batch);
  COURIER_ASSERT_RESULT_VALUE(recovered);
  EXPECT_EQ(recovered.assumeValue().status, InboundStatus::kDelivered);
  EXPECT_EQ(recovered.assumeValue().votes, 2);

  auto again = router->recover(kOperator, kRemote, batch);
  COURIER_ASSERT_RESULT_VALUE(again);
  EXPECT_EQ(again.assumeValue().status, InboundStatus::kAlreadyDelivered);
}

/**
 * @given an operator supplies a batch nobody voted for
 * @when it is recovered
 * @then it stays pending with no votes
 */
TEST_F(MultiAdapterTest, RecoverDoesNotVote) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(_, _)).Times(0);
  auto recovered = router->recover(kOperator, kRemote, batch);
  COURIER_ASSERT_RESULT_VALUE(recovered);
  EXPECT_EQ(recovered.assumeValue().status, InboundStatus::kPendingQuorum);
  EXPECT_EQ(recovered.assumeValue().votes, 0);
}

/**
 * @given a proof for a hash whose batch never arrives and a delivered batch
 * @when an operator purges them
 * @then the undelivered record is dropped, while the delivered one is kept
 * and a non-operator is refused
 */
TEST_F(MultiAdapterTest, PurgeUndelivered) {
  fileQuorumOfTwo();
  auto orphan = wire::batchHash(
      wire::pack({TaggedMessageProperties::makeMessage(1, 0, {0x7F})})
          .assumeValue());
  deliver(wire::packProof(orphan), "b");
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));
  deliver(batch, "a");
  deliver(proof, "c");
  ASSERT_EQ(router->pendingHashes(kRemote), std::vector<hash256_t>{orphan});

  COURIER_ASSERT_ERROR_CODE(router->purge(kAdmin, kRemote, orphan),
                            RouterError::Code::kUnauthorized);
  COURIER_ASSERT_RESULT_VALUE(router->purge(kOperator, kRemote, orphan));
  EXPECT_TRUE(router->pendingHashes(kRemote).empty());
  EXPECT_FALSE(router->voteState(kRemote, orphan));

  COURIER_ASSERT_ERROR_CODE(router->purge(kOperator, kRemote, orphan),
                            RouterError::Code::kUnknownBatch);
  COURIER_ASSERT_ERROR_CODE(router->purge(kOperator, kRemote, hash),
                            RouterError::Code::kUnknownBatch);
  EXPECT_EQ(deliver(proof, "b").status, InboundStatus::kAlreadyDelivered);
}

/**
 * @given inbound frames that can not be accepted
 * @when they are handled
 * @then each is refused with its reason and nothing is recorded
 */
TEST_F(MultiAdapterTest, InboundRefusals) {
  fileQuorumOfTwo();
  COURIER_ASSERT_ERROR_CODE(router->handle(kRemote, batch, "z"),
                            RouterError::Code::kUnknownAdapter);
  COURIER_ASSERT_ERROR_CODE(router->handle(kLocal, batch, "a"),
                            RouterError::Code::kLocalSource);

  auto truncated = batch;
  truncated.pop_back();
  COURIER_ASSERT_ERROR_CODE(router->handle(kRemote, truncated, "a"),
                            RouterError::Code::kMalformedFrame);
  EXPECT_TRUE(router->pendingHashes(kRemote).empty());

  handler.reset();
  COURIER_ASSERT_ERROR_CODE(router->handle(kRemote, batch, "a"),
                            RouterError::Code::kNoBatchHandler);
}

/**
 * @given a batch voted before its tenant has any setup
 * @when a setup is filed and another vote arrives
 * @then the batch waits and then gets delivered under the new setup
 */
TEST_F(MultiAdapterTest, PendingUntilFiled) {
  COURIER_ASSERT_RESULT_VALUE(router->file(
      kAdmin, kRemote, 5, {adapters.begin(), adapters.end()}, 2, 0, 3));
  auto outcome = deliver(batch, "a");
  EXPECT_EQ(outcome.status, InboundStatus::kPendingQuorum);
  EXPECT_EQ(outcome.votes, 0);

  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));
  EXPECT_EQ(deliver(proof, "b").status, InboundStatus::kDelivered);
}

/**
 * Every order of the batch report by a and the proof reports by b and c,
 * alone and with one report repeated at each later position
 */
std::vector<std::string> reportOrders() {
  std::set<std::string> orders;
  std::string order = "abc";
  do {
    orders.insert(order);
    for (size_t i = 0; i < order.size(); ++i) {
      for (size_t at = i + 1; at <= order.size(); ++at) {
        auto repeated = order;
        repeated.insert(repeated.begin() + at, order[i]);
        orders.insert(repeated);
      }
    }
  } while (std::next_permutation(order.begin(), order.end()));
  return {orders.begin(), orders.end()};
}

class ReportOrderTest : public MultiAdapterTest,
                        public ::testing::WithParamInterface<std::string> {};

INSTANTIATE_TEST_SUITE_P(
    AllOrders,
    ReportOrderTest,
    ::testing::ValuesIn(reportOrders()),
    [](const ::testing::TestParamInfo<std::string> &info) {
      return info.param;
    });

/**
 * @given quorum of two out of a, b and c, with a carrying the batch
 * @when the reports arrive in the given order
 * @then the batch is handed over exactly once, at the first report where
 * the batch is held with two votes, and every later report is a no-op
 */
TEST_P(ReportOrderTest, DeliveredExactlyOnce) {
  fileQuorumOfTwo();
  EXPECT_CALL(*handler, handleBatch(kRemote, messages))
      .WillOnce(Return(DispatchReport{2, 0}));

  std::set<char> voters;
  bool delivered = false;
  for (const auto reporter : GetParam()) {
    auto outcome = deliver(reporter == 'a' ? batch : proof,
                           std::string(1, reporter));
    if (delivered) {
      EXPECT_EQ(outcome.status, InboundStatus::kAlreadyDelivered);
      continue;
    }
    voters.insert(reporter);
    const bool due = voters.count('a') > 0 and voters.size() >= 2;
    EXPECT_EQ(outcome.status == InboundStatus::kDelivered, due);
    delivered = due;
  }

  EXPECT_TRUE(delivered);
  auto state = router->voteState(kRemote, hash);
  ASSERT_TRUE(state);
  EXPECT_EQ(state->state, "Delivered");
  EXPECT_TRUE(router->pendingHashes(kRemote).empty());
}

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/vote_record.hpp"

#include <gtest/gtest.h>
#include "crypto/sha3_hash.hpp"
#include "module/courier/adapter/mock_adapter.hpp"
#include "multi_adapter/vote_storage.hpp"

using namespace courier;
using namespace courier::multi_adapter;

namespace {
  const std::vector<types::Bytes> kMessages{{0x01}, {0x02, 0x03}};

  AdapterSetup makeSetup(std::vector<std::string> ids, size_t threshold) {
    AdapterSetup setup{{}, threshold, 0, ids.size()};
    for (auto &id : ids) {
      setup.adapters.push_back(
          std::make_shared<adapter::MockAdapter>(std::move(id)));
    }
    return setup;
  }
}  // namespace

/**
 * @given a fresh record
 * @when votes arrive before the batch
 * @then they are kept while awaiting the payload and a repeated vote is
 * refused
 */
TEST(VoteRecordTest, VotesBeforePayload) {
  VoteRecord record;
  EXPECT_FALSE(record.hasPayload());
  EXPECT_TRUE(record.addVote("a"));
  EXPECT_TRUE(record.addVote("b"));
  EXPECT_FALSE(record.addVote("a"));
  EXPECT_EQ(record.voters(), (Voters{"a", "b"}));
  EXPECT_FALSE(record.messages());
  EXPECT_EQ(record.snapshot().state, "AwaitingPayload");
  EXPECT_FALSE(record.markDelivered());
}

/**
 * @given a record with votes
 * @when the batch is attached twice
 * @then the votes survive the transition and the first batch is kept
 */
TEST(VoteRecordTest, AttachPayloadKeepsVotes) {
  VoteRecord record;
  record.addVote("a");
  record.attachPayload(kMessages);
  record.attachPayload({{0xFF}});

  ASSERT_TRUE(record.hasPayload());
  EXPECT_EQ(*record.messages(), kMessages);
  EXPECT_EQ(record.voters(), (Voters{"a"}));
  EXPECT_TRUE(record.snapshot().payload_held);
  EXPECT_EQ(record.snapshot().state, "PendingQuorum");
}

/**
 * @given a record voted by members and a stranger
 * @when votes are counted against a setup
 * @then only members count
 */
TEST(VoteRecordTest, CountsOnlyMembers) {
  VoteRecord record;
  record.addVote("a");
  record.addVote("stranger");
  record.addVote("c");
  EXPECT_EQ(record.countVotes(makeSetup({"a", "b", "c"}, 2)), 2);
  EXPECT_EQ(record.countVotes(makeSetup({"b"}, 1)), 0);
}

/**
 * @given a pending record
 * @when it is marked delivered
 * @then the batch is handed out once, the record refuses further votes and
 * payloads
 */
TEST(VoteRecordTest, DeliveredIsTerminal) {
  VoteRecord record;
  record.addVote("a");
  record.attachPayload(kMessages);

  auto delivered = record.markDelivered();
  ASSERT_TRUE(delivered);
  EXPECT_EQ(*delivered, kMessages);
  EXPECT_TRUE(record.isDelivered());
  EXPECT_FALSE(record.markDelivered());

  EXPECT_FALSE(record.addVote("b"));
  record.attachPayload(kMessages);
  EXPECT_FALSE(record.hasPayload());
  EXPECT_EQ(record.voters(), (Voters{"a"}));
  EXPECT_EQ(record.snapshot().state, "Delivered");
}

/**
 * @given records for two sources
 * @when pending hashes are listed
 * @then delivered records are left out and sources are kept apart
 */
TEST(VoteStorageTest, PendingPerSource) {
  VoteStorage storage;
  auto h1 = sha3_256(std::string_view{"one"});
  auto h2 = sha3_256(std::string_view{"two"});

  storage.getOrCreate(2, h1).addVote("a");
  auto &record = storage.getOrCreate(2, h2);
  record.attachPayload(kMessages);
  record.markDelivered();
  storage.getOrCreate(3, h1);

  EXPECT_EQ(storage.size(), 3);
  EXPECT_EQ(storage.pending(2), std::vector<hash256_t>{h1});
  EXPECT_EQ(storage.pending(3), std::vector<hash256_t>{h1});
  EXPECT_TRUE(storage.find(2, h2)->isDelivered());
  EXPECT_FALSE(storage.find(4, h1));
}

/**
 * @given records of one source
 * @when one of them is erased
 * @then only that record is gone and erasing it again reports nothing
 */
TEST(VoteStorageTest, EraseRecord) {
  VoteStorage storage;
  auto h1 = sha3_256(std::string_view{"one"});
  auto h2 = sha3_256(std::string_view{"two"});
  storage.getOrCreate(2, h1).addVote("a");
  storage.getOrCreate(2, h2).addVote("b");

  EXPECT_TRUE(storage.erase(2, h1));
  EXPECT_FALSE(storage.erase(2, h1));
  EXPECT_FALSE(storage.erase(3, h2));
  EXPECT_EQ(storage.pending(2), std::vector<hash256_t>{h2});
  EXPECT_EQ(storage.size(), 1);
}

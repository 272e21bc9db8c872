/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "messages/impl/tagged_message_properties.hpp"

#include <gtest/gtest.h>

using namespace courier;
using courier::messages::TaggedMessageProperties;

class TaggedMessagePropertiesTest : public ::testing::Test {
 public:
  TaggedMessageProperties properties{50000, {{1, 80000}, {2, 120000}}};
};

/**
 * @given a message built with a tenant
 * @when its tenant is read
 * @then the big-endian tenant from the header is returned
 */
TEST_F(TaggedMessagePropertiesTest, TenantFromHeader) {
  auto message = TaggedMessageProperties::makeMessage(
      1, 0x0102030405060708ull, {0xAB, 0xCD});
  ASSERT_EQ(message.size(), TaggedMessageProperties::kHeaderSize + 2);
  EXPECT_EQ(message[1], 0x01);
  EXPECT_EQ(message[8], 0x08);
  EXPECT_EQ(properties.tenantOf(message), 0x0102030405060708ull);
}

/**
 * @given a message shorter than the header
 * @when its tenant is read
 * @then it belongs to the global tenant
 */
TEST_F(TaggedMessagePropertiesTest, ShortMessageIsGlobal) {
  EXPECT_EQ(properties.tenantOf(types::Bytes{1, 0, 0}), types::kGlobalTenant);
}

/**
 * @given messages with known and unknown tags
 * @when their gas limits are read
 * @then the tag gas or the default gas is returned
 */
TEST_F(TaggedMessagePropertiesTest, GasByTag) {
  EXPECT_EQ(properties.gasLimitOf(TaggedMessageProperties::makeMessage(
                2, 7, {})),
            120000);
  EXPECT_EQ(properties.gasLimitOf(TaggedMessageProperties::makeMessage(
                9, 7, {})),
            50000);
  EXPECT_EQ(properties.gasLimitOf(types::Bytes{}), 50000);
}

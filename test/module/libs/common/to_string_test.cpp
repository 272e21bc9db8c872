/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/to_string.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

const std::string kTestString("adapter-a");

struct MockToStringable {
  MOCK_CONST_METHOD0(toString, std::string());
};

std::shared_ptr<MockToStringable> makeObj(std::string string = kTestString) {
  auto obj = std::make_shared<MockToStringable>();
  EXPECT_CALL(*obj, toString()).WillOnce(::testing::Return(string));
  return obj;
}

using namespace courier::to_string;

/**
 * @given std::string and plain numbers
 * @when toString is called on them
 * @then strings are returned as is and numbers as std::to_string does
 */
TEST(ToStringTest, PlainValues) {
  EXPECT_EQ(toString(std::string{"network"}), "network");
  EXPECT_EQ(toString(uint16_t{7}), "7");
  EXPECT_EQ(toString(uint64_t{18446744073709551615ull}),
            "18446744073709551615");
  EXPECT_EQ(toString(false), "false");
}

/**
 * @given ToStringable object behind a shared pointer and an optional
 * @when toString is called on it
 * @then the object description is returned
 */
TEST(ToStringTest, WrappedDereferenceable) {
  auto obj = makeObj();
  EXPECT_EQ(toString(obj), kTestString);
  EXPECT_CALL(*obj, toString()).WillOnce(::testing::Return(kTestString));
  EXPECT_EQ(toString(std::make_optional(obj)), kTestString);
}

/**
 * @given empty pointer and optional
 * @when toString is called on them
 * @then result has "not set"
 */
TEST(ToStringTest, UnsetDereferenceable) {
  EXPECT_EQ(toString(std::shared_ptr<MockToStringable>{}), "(not set)");
  EXPECT_EQ(toString(std::optional<int>{}), "(not set)");
}

/**
 * @given a set of voter ids and a vector of adapters with a missing element
 * @when toString is called on them
 * @then elements are listed in iteration order
 */
TEST(ToStringTest, Collections) {
  std::set<std::string> voters{"b", "a"};
  EXPECT_EQ(toString(voters), "[a, b]");

  std::vector<std::shared_ptr<MockToStringable>> adapters;
  EXPECT_EQ(toString(adapters), "[]");
  adapters.push_back(makeObj("axelar"));
  adapters.push_back(makeObj("wormhole"));
  adapters.push_back(nullptr);
  EXPECT_EQ(toString(adapters), "[axelar, wormhole, (not set)]");
}

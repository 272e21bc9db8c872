/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/adapter_registry.hpp"

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"
#include "module/courier/adapter/mock_adapter.hpp"

using namespace courier;
using namespace courier::multi_adapter;
using courier::adapter::MockAdapter;

class AdapterRegistryTest : public ::testing::Test {
 public:
  static constexpr types::NetworkId kLocal = 1;
  static constexpr types::NetworkId kRemote = 2;
  static constexpr types::TenantId kTenant = 42;

  AdapterSetup makeSetup(std::vector<std::string> ids,
                         size_t threshold,
                         size_t primary_index,
                         size_t recovery_index) {
    AdapterSetup setup{{}, threshold, primary_index, recovery_index};
    for (auto &id : ids) {
      setup.adapters.push_back(std::make_shared<MockAdapter>(std::move(id)));
    }
    return setup;
  }

  AdapterRegistry registry{kLocal, getTestLogger("AdapterRegistry")};
};

/**
 * @given setups violating each registration rule
 * @when they are validated
 * @then every one is rejected, while the boundary cases are accepted
 */
TEST_F(AdapterRegistryTest, ValidateRules) {
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({}, 1, 0, 0)));
  COURIER_ASSERT_RESULT_ERROR(
      validate(makeSetup({"a", "b", "c", "d", "e", "f", "g", "h", "i"},
                         1,
                         0,
                         9)));
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({"a", "a"}, 1, 0, 2)));
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({"a", "b"}, 0, 0, 2)));
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({"a", "b"}, 1, 0, 3)));
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({"a", "b", "c"}, 3, 0, 2)));
  COURIER_ASSERT_RESULT_ERROR(validate(makeSetup({"a", "b", "c"}, 1, 2, 2)));

  auto with_null = makeSetup({"a", "b"}, 1, 0, 2);
  with_null.adapters[1] = nullptr;
  COURIER_ASSERT_RESULT_ERROR(validate(with_null));

  COURIER_ASSERT_RESULT_VALUE(validate(makeSetup({"a"}, 1, 0, 1)));
  COURIER_ASSERT_RESULT_VALUE(validate(
      makeSetup({"a", "b", "c", "d", "e", "f", "g", "h"}, 2, 1, 3)));
}

/**
 * @given a valid setup
 * @when it is filed for the local network
 * @then it is rejected
 */
TEST_F(AdapterRegistryTest, LocalNetworkRejected) {
  COURIER_ASSERT_ERROR_CODE(
      registry.file(types::RouteKey{kLocal, kTenant},
                    makeSetup({"a"}, 1, 0, 1)),
      RouterError::Code::kInvalidSetup);
  EXPECT_TRUE(registry.routes().empty());
}

/**
 * @given a global setup and a tenant setup for the same remote
 * @when setups are looked up
 * @then the tenant gets its own setup, other tenants get the global one, and
 * after unfiling the tenant falls back to the global one
 */
TEST_F(AdapterRegistryTest, TenantFallback) {
  COURIER_ASSERT_RESULT_VALUE(
      registry.file(types::RouteKey{kRemote, types::kGlobalTenant},
                    makeSetup({"a", "b"}, 2, 0, 2)));
  COURIER_ASSERT_RESULT_VALUE(registry.file(types::RouteKey{kRemote, kTenant},
                                            makeSetup({"c"}, 1, 0, 1)));

  auto tenant_setup = registry.find(kRemote, kTenant);
  ASSERT_TRUE(tenant_setup);
  EXPECT_TRUE(tenant_setup->contains("c"));

  auto other_setup = registry.find(kRemote, 7);
  ASSERT_TRUE(other_setup);
  EXPECT_TRUE(other_setup->contains("a"));
  EXPECT_EQ(registry.find(3, kTenant), nullptr);

  EXPECT_TRUE(registry.unfile(types::RouteKey{kRemote, kTenant}));
  EXPECT_FALSE(registry.unfile(types::RouteKey{kRemote, kTenant}));
  EXPECT_TRUE(registry.find(kRemote, kTenant)->contains("a"));
}

/**
 * @given a filed setup
 * @when it is replaced and the old pointer is still held
 * @then the held setup stays unchanged and lookups see the new one
 */
TEST_F(AdapterRegistryTest, ReplaceKeepsHeldSetup) {
  types::RouteKey key{kRemote, kTenant};
  COURIER_ASSERT_RESULT_VALUE(registry.file(key, makeSetup({"a"}, 1, 0, 1)));
  auto held = registry.find(kRemote, kTenant);

  COURIER_ASSERT_RESULT_VALUE(
      registry.file(key, makeSetup({"b", "c"}, 1, 1, 2)));
  EXPECT_TRUE(held->contains("a"));
  EXPECT_EQ(registry.find(kRemote, kTenant)->primary_index, 1);
  EXPECT_EQ(registry.routes().size(), 1);
}

/**
 * @given setups for two tenants of one remote
 * @when adapters are checked for being known
 * @then adapters of any tenant of that remote are known, others are not
 */
TEST_F(AdapterRegistryTest, KnownAdapters) {
  COURIER_ASSERT_RESULT_VALUE(registry.file(types::RouteKey{kRemote, 5},
                                            makeSetup({"a"}, 1, 0, 1)));
  COURIER_ASSERT_RESULT_VALUE(registry.file(types::RouteKey{kRemote, 6},
                                            makeSetup({"b", "r"}, 1, 0, 1)));
  COURIER_ASSERT_RESULT_VALUE(registry.file(types::RouteKey{3, 5},
                                            makeSetup({"z"}, 1, 0, 1)));

  EXPECT_TRUE(registry.isKnownAdapter(kRemote, "a"));
  EXPECT_TRUE(registry.isKnownAdapter(kRemote, "r"));
  EXPECT_FALSE(registry.isKnownAdapter(kRemote, "z"));
  EXPECT_FALSE(registry.isKnownAdapter(4, "a"));
}

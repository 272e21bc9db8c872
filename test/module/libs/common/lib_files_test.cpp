/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"

namespace fs = boost::filesystem;

namespace {
  const std::string kText =
      "{\n"
      "  \"local_network\": 1,\n"
      "  \"configurators\": [\"admin\"]\n"
      "}\n";

  const fs::path kTestDir{fs::temp_directory_path()};
  const fs::path kTextFilePath{kTestDir / "courier_read_file_test.json"};
  const fs::path kNonexistentFilePath{kTestDir
                                      / "courier_read_file_test_missing"};
}  // namespace

class ReadFileTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    for (const auto &f : {kTextFilePath, kNonexistentFilePath}) {
      if (fs::exists(f)) {
        fs::remove(f);
      }
    }
    std::ofstream out(kTextFilePath.string(), std::ios::trunc);
    out << kText;
  }

  static void TearDownTestSuite() {
    fs::remove(kTextFilePath);
  }
};

/**
 * @given a text file
 * @when it is read
 * @then the contents are returned unchanged
 */
TEST_F(ReadFileTest, TextFile) {
  auto result = courier::readTextFile(kTextFilePath);
  COURIER_ASSERT_RESULT_VALUE(result) << "Could not read " << kTextFilePath;
  EXPECT_EQ(result.assumeValue(), kText);
}

/**
 * @given a path with no file
 * @when it is read
 * @then an error is returned
 */
TEST_F(ReadFileTest, NonexistentFile) {
  ASSERT_FALSE(fs::exists(kNonexistentFilePath));
  auto result = courier::readTextFile(kNonexistentFilePath);
  COURIER_ASSERT_RESULT_ERROR(result);
}

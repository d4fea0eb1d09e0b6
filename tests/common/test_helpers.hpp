#pragma once

#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "idkit/core/random_source.hpp"

namespace idkit::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Write `content` to `name` inside the temporary directory
  std::filesystem::path writeFile(const std::string& name, const std::string& content);

  std::filesystem::path temp_dir_;
};

// RandomSource that replays a fixed list of draws, cycling when exhausted.
// Records every requested range so tests can count draws.
class SequenceRandomSource : public idkit::core::RandomSource {
 public:
  explicit SequenceRandomSource(std::vector<int> values);

  int nextInt(int low, int high) override;

  std::size_t drawCount() const { return draws_; }
  int lastLow() const { return last_low_; }
  int lastHigh() const { return last_high_; }

 private:
  std::vector<int> values_;
  std::size_t draws_ = 0;
  int last_low_ = 0;
  int last_high_ = 0;
};

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace idkit::test

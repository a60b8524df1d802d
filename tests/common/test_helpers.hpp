#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "hlid/core/generator.hpp"
#include "hlid/core/hlid.hpp"

namespace hlid::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path temp_dir_;
};

// Secret from the reference vectors; exactly 32 bytes
inline constexpr const char* kTestSecret = "0123456789abcdef0123456789abcdef";

// Nonce source that hands out the same bytes every time and counts calls
class FixedNonceSource : public hlid::core::NonceSource {
 public:
  explicit FixedNonceSource(hlid::core::Nonce nonce) : nonce_(nonce) {}

  Result<hlid::core::Nonce> next() override {
    ++calls_;
    return nonce_;
  }

  int calls() const { return calls_; }

 private:
  hlid::core::Nonce nonce_;
  int calls_ = 0;
};

// Nonce source that always fails, for error propagation tests
class FailingNonceSource : public hlid::core::NonceSource {
 public:
  Result<hlid::core::Nonce> next() override {
    return makeErrorResult<hlid::core::Nonce>(ErrorCode::kCryptoError, "entropy unavailable");
  }
};

// Build a tick time from UTC calendar fields; valid for the whole 1970..9999 range
hlid::util::TickTime utcTicks(int year, unsigned month, unsigned day, unsigned hour = 0,
                              unsigned minute = 0, unsigned second = 0, unsigned tick = 0);

// Same as utcTicks but as a system_clock time point, so only up to 2262
std::chrono::system_clock::time_point utcTime(int year, unsigned month, unsigned day,
                                              unsigned hour = 0, unsigned minute = 0,
                                              unsigned second = 0, unsigned tick = 0);

// Mint a batch of identifiers with strictly increasing timestamps
std::vector<hlid::core::Hlid> createTestIds(size_t count);

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

}  // namespace hlid::test

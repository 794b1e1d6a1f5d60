/**
 * @file uuid_test.cpp
 * @brief Tests for random UUID generation
 */

#include "utils/uuid.h"

#include <gtest/gtest.h>

#include <mutex>
#include <regex>
#include <set>
#include <thread>
#include <vector>

namespace monitorgate::utils {

TEST(UuidTest, HasVersion4Layout) {
  static const std::regex kPattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  for (int i = 0; i < 100; ++i) {
    std::string uuid = GenerateUuidV4();
    EXPECT_TRUE(std::regex_match(uuid, kPattern)) << uuid;
  }
}

TEST(UuidTest, ValuesAreDistinct) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    seen.insert(GenerateUuidV4());
  }
  EXPECT_EQ(seen.size(), 1000U);
}

TEST(UuidTest, ConcurrentCallersGetDistinctValues) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;
  std::mutex mutex;
  std::set<std::string> seen;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(GenerateUuidV4());
      }
      std::lock_guard<std::mutex> lock(mutex);
      seen.insert(local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(seen.size(), static_cast<size_t>(kThreads * kPerThread));
}

}  // namespace monitorgate::utils

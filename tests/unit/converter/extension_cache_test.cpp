#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "chunkwise_core/converter/extension_cache.hpp"

namespace chunkwise_core {

class ExtensionCacheTest : public ::testing::Test {
 protected:
  ExtensionCache::Loader counting_loader(std::vector<std::string> result) {
    return [this, result]() {
      load_count_++;
      return result;
    };
  }

  ExtensionCache cache_;
  std::atomic<int> load_count_{0};
};

TEST_F(ExtensionCacheTest, StartsEmpty) {
  EXPECT_FALSE(cache_.is_loaded());
  EXPECT_FALSE(cache_.contains(".md"));
  EXPECT_TRUE(cache_.snapshot().empty());
}

TEST_F(ExtensionCacheTest, LoadsOnceAndServesFromCache) {
  // Act
  cache_.ensure_loaded(counting_loader({".pdf", ".md"}));
  cache_.ensure_loaded(counting_loader({".docx"}));

  // Assert
  EXPECT_EQ(load_count_.load(), 1);
  EXPECT_TRUE(cache_.is_loaded());
  EXPECT_TRUE(cache_.contains(".pdf"));
  EXPECT_FALSE(cache_.contains(".docx"));
}

TEST_F(ExtensionCacheTest, SnapshotIsSorted) {
  cache_.ensure_loaded(counting_loader({".txt", ".docx", ".md"}));

  EXPECT_EQ(cache_.snapshot(), (std::vector<std::string>{".docx", ".md", ".txt"}));
}

TEST_F(ExtensionCacheTest, EmptyResultIsFetchedAgain) {
  cache_.ensure_loaded(counting_loader({}));
  EXPECT_FALSE(cache_.is_loaded());

  cache_.ensure_loaded(counting_loader({".md"}));

  EXPECT_EQ(load_count_.load(), 2);
  EXPECT_TRUE(cache_.contains(".md"));
}

TEST_F(ExtensionCacheTest, LoaderFailureLeavesCacheEmpty) {
  EXPECT_THROW(cache_.ensure_loaded([]() -> std::vector<std::string> {
    throw std::runtime_error("service down");
  }),
               std::runtime_error);

  EXPECT_FALSE(cache_.is_loaded());
}

TEST_F(ExtensionCacheTest, InvalidateForcesReload) {
  cache_.ensure_loaded(counting_loader({".md"}));
  cache_.invalidate();

  EXPECT_FALSE(cache_.is_loaded());

  cache_.ensure_loaded(counting_loader({".pdf"}));
  EXPECT_EQ(load_count_.load(), 2);
  EXPECT_TRUE(cache_.contains(".pdf"));
  EXPECT_FALSE(cache_.contains(".md"));
}

TEST_F(ExtensionCacheTest, ConcurrentFirstCallersFetchOnce) {
  // Arrange
  auto slow_loader = [this]() {
    load_count_++;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return std::vector<std::string>{".md", ".pdf"};
  };

  // Act
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() { cache_.ensure_loaded(slow_loader); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  // Assert
  EXPECT_EQ(load_count_.load(), 1);
  EXPECT_TRUE(cache_.contains(".md"));
}

}  // namespace chunkwise_core

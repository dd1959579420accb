#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "docu_core/llm/ollama_client.hpp"

namespace docu_core {

TEST(L2NormalizeTest, ScalesToUnitLength) {
  std::vector<float> vector = {3.0f, 4.0f};

  l2_normalize(vector);

  EXPECT_FLOAT_EQ(vector[0], 0.6f);
  EXPECT_FLOAT_EQ(vector[1], 0.8f);
}

TEST(L2NormalizeTest, UnitVectorIsUnchanged) {
  std::vector<float> vector = {0.0f, 1.0f, 0.0f};

  l2_normalize(vector);

  EXPECT_FLOAT_EQ(vector[1], 1.0f);
  EXPECT_FLOAT_EQ(vector[0], 0.0f);
}

TEST(L2NormalizeTest, ZeroVectorIsLeftAlone) {
  std::vector<float> vector = {0.0f, 0.0f, 0.0f};

  l2_normalize(vector);

  for (float value : vector) {
    EXPECT_EQ(value, 0.0f);
    EXPECT_FALSE(std::isnan(value));
  }
}

TEST(RetryBackoffDelayTest, DoublesPerRetry) {
  EXPECT_EQ(retry_backoff_delay(500, 1).count(), 500);
  EXPECT_EQ(retry_backoff_delay(500, 2).count(), 1000);
  EXPECT_EQ(retry_backoff_delay(500, 4).count(), 4000);
}

TEST(RetryBackoffDelayTest, LargeRetryCountsAreCapped) {
  EXPECT_EQ(retry_backoff_delay(500, 65).count(), kMaxRetryDelay.count());
  EXPECT_EQ(retry_backoff_delay(500, 1000).count(), kMaxRetryDelay.count());
  EXPECT_EQ(retry_backoff_delay(1000000, 1).count(), kMaxRetryDelay.count());
}

TEST(RetryBackoffDelayTest, ZeroBaseMeansNoDelay) {
  EXPECT_EQ(retry_backoff_delay(0, 5).count(), 0);
}

}  // namespace docu_core

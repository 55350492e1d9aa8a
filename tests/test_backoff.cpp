#include <gtest/gtest.h>

#include "core/backoff.hpp"

using namespace kuberde;
using std::chrono::milliseconds;

TEST(BackoffTest, GrowsAndCaps) {
  BackoffConfig config{milliseconds(100), milliseconds(1000), 2.0, 0};
  EXPECT_EQ(compute_backoff(0, config), milliseconds(100));
  EXPECT_EQ(compute_backoff(1, config), milliseconds(200));
  EXPECT_EQ(compute_backoff(3, config), milliseconds(800));
  EXPECT_EQ(compute_backoff(4, config), milliseconds(1000));
  EXPECT_EQ(compute_backoff(500, config), milliseconds(1000));
}

TEST(BackoffTest, MultiplierBelowOneIsFlat) {
  BackoffConfig config{milliseconds(250), milliseconds(1000), 0.5, 0};
  EXPECT_EQ(compute_backoff(5, config), milliseconds(250));
}

TEST(BackoffTest, SequenceAndReset) {
  Backoff backoff({milliseconds(10), milliseconds(40), 2.0, 3});
  EXPECT_FALSE(backoff.exhausted());
  EXPECT_EQ(backoff.next(), milliseconds(10));
  EXPECT_EQ(backoff.next(), milliseconds(20));
  EXPECT_EQ(backoff.next(), milliseconds(40));
  EXPECT_TRUE(backoff.exhausted());
  EXPECT_EQ(backoff.attempts(), 3);

  backoff.reset();
  EXPECT_FALSE(backoff.exhausted());
  EXPECT_EQ(backoff.next(), milliseconds(10));
}

TEST(BackoffTest, UnboundedNeverExhausts) {
  Backoff backoff({milliseconds(1), milliseconds(2), 2.0, 0});
  for (int i = 0; i < 100; ++i) backoff.next();
  EXPECT_FALSE(backoff.exhausted());
}

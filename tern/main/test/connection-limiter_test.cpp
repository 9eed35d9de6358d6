#include "tern/internal/connection-limiter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <thread>
#include <utility>

#include "tern/timedef.hpp"

namespace tern::internal {

using namespace std::chrono_literals;

TEST(ConnectionLimiterTest, ZeroCapacityThrows) { EXPECT_THROW(ConnectionLimiter(0), std::invalid_argument); }

TEST(ConnectionLimiterTest, AcquireUpToCapacity) {
  ConnectionLimiter limiter(2);
  auto first = limiter.tryAcquire();
  auto second = limiter.tryAcquireFor(1ms);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(limiter.active(), 0U);
  first->activate();
  second->activate();
  EXPECT_EQ(limiter.active(), 2U);
  EXPECT_FALSE(limiter.tryAcquire());
  EXPECT_FALSE(limiter.tryAcquireFor(5ms));
}

TEST(ConnectionLimiterTest, PermitReleasedOnDestruction) {
  ConnectionLimiter limiter(1);
  {
    auto permit = limiter.tryAcquire();
    ASSERT_TRUE(permit);
    permit->activate();
    EXPECT_EQ(limiter.active(), 1U);
  }
  EXPECT_EQ(limiter.active(), 0U);
  EXPECT_TRUE(limiter.tryAcquire());
}

TEST(ConnectionLimiterTest, MovedPermitIsReleasedOnce) {
  ConnectionLimiter limiter(1);
  std::optional<ConnectionPermit> permit = limiter.tryAcquire();
  ASSERT_TRUE(permit);
  permit->activate();
  ConnectionPermit moved(std::move(*permit));
  EXPECT_FALSE(*permit);
  EXPECT_TRUE(moved);
  EXPECT_TRUE(moved.activated());
  permit.reset();
  EXPECT_EQ(limiter.active(), 1U);
  moved.release();
  moved.release();
  EXPECT_EQ(limiter.active(), 0U);
  EXPECT_EQ(limiter.releaseGeneration(), 1U);
}

TEST(ConnectionLimiterTest, BlockedAcquireSucceedsAfterRelease) {
  ConnectionLimiter limiter(1);
  auto permit = limiter.tryAcquire();
  ASSERT_TRUE(permit);
  std::jthread releaser([&permit] {
    std::this_thread::sleep_for(20ms);
    permit->release();
  });
  auto next = limiter.tryAcquireFor(5s);
  EXPECT_TRUE(next);
}

TEST(ConnectionLimiterTest, WaitForReleaseObservesRelease) {
  ConnectionLimiter limiter(1);
  auto permit = limiter.tryAcquire();
  const auto generation = limiter.releaseGeneration();
  std::jthread releaser([&permit] {
    std::this_thread::sleep_for(20ms);
    permit.reset();
  });
  EXPECT_TRUE(limiter.waitForRelease(generation, 5s));
}

TEST(ConnectionLimiterTest, WaitForReleaseTimesOut) {
  ConnectionLimiter limiter(1);
  auto permit = limiter.tryAcquire();
  EXPECT_FALSE(limiter.waitForRelease(limiter.releaseGeneration(), 10ms));
}

TEST(ConnectionLimiterTest, InterruptWakesUpWaiters) {
  ConnectionLimiter limiter(1);
  auto permit = limiter.tryAcquire();
  const auto start = SteadyClock::now();
  std::jthread interrupter([&limiter] {
    std::this_thread::sleep_for(20ms);
    limiter.interrupt();
  });
  EXPECT_FALSE(limiter.waitForRelease(limiter.releaseGeneration(), 10s));
  EXPECT_LT(SteadyClock::now() - start, 5s);

  limiter.reset();
  EXPECT_FALSE(limiter.waitForRelease(limiter.releaseGeneration(), 1ms));
}

TEST(ConnectionLimiterTest, WaitUntilIdle) {
  ConnectionLimiter limiter(4);
  EXPECT_TRUE(limiter.waitUntilIdle(SteadyClock::now()));

  auto permit = limiter.tryAcquire();
  ASSERT_TRUE(permit);
  EXPECT_TRUE(limiter.waitUntilIdle(SteadyClock::now()));
  permit->activate();
  EXPECT_FALSE(limiter.waitUntilIdle(SteadyClock::now() + 10ms));

  std::jthread releaser([&permit] {
    std::this_thread::sleep_for(20ms);
    permit.reset();
  });
  EXPECT_TRUE(limiter.waitUntilIdle(SteadyClock::now() + 5s));
}

TEST(ConnectionLimiterTest, HeldPermitIsNotAnActiveConnection) {
  ConnectionLimiter limiter(2);
  auto held = limiter.tryAcquire();
  ASSERT_TRUE(held);
  EXPECT_EQ(limiter.active(), 0U);
  EXPECT_FALSE(held->activated());

  held->activate();
  held->activate();
  EXPECT_EQ(limiter.active(), 1U);

  // A permit released without activation still frees its slot.
  auto spare = limiter.tryAcquire();
  ASSERT_TRUE(spare);
  EXPECT_FALSE(limiter.tryAcquire());
  spare->release();
  EXPECT_EQ(limiter.active(), 1U);
  EXPECT_TRUE(limiter.tryAcquire());

  held.reset();
  EXPECT_EQ(limiter.active(), 0U);
}

}  // namespace tern::internal

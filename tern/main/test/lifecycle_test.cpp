#include "tern/internal/lifecycle.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "tern/timedef.hpp"

namespace tern::internal {

using namespace std::chrono_literals;

TEST(LifecycleTest, EnterRunningOnlyOnce) {
  Lifecycle lifecycle;
  EXPECT_TRUE(lifecycle.isIdle());
  EXPECT_TRUE(lifecycle.tryEnterRunning());
  EXPECT_TRUE(lifecycle.isRunning());
  EXPECT_FALSE(lifecycle.tryEnterRunning());

  lifecycle.enterDraining();
  EXPECT_TRUE(lifecycle.isDraining());
  EXPECT_FALSE(lifecycle.tryEnterRunning());
}

TEST(LifecycleTest, ResetClearsState) {
  Lifecycle lifecycle;
  ASSERT_TRUE(lifecycle.tryEnterRunning());
  lifecycle.requestStop();
  EXPECT_TRUE(lifecycle.isStopRequested());

  lifecycle.reset();

  EXPECT_TRUE(lifecycle.isIdle());
  EXPECT_FALSE(lifecycle.isStopRequested());
}

TEST(LifecycleTest, SleepInterruptedByStopRequest) {
  Lifecycle lifecycle;
  const auto start = SteadyClock::now();
  std::jthread stopper([&lifecycle] {
    std::this_thread::sleep_for(20ms);
    lifecycle.requestStop();
  });
  EXPECT_TRUE(lifecycle.sleepFor(10s));
  EXPECT_LT(SteadyClock::now() - start, 5s);
}

TEST(LifecycleTest, SleepWithoutStopRequest) {
  Lifecycle lifecycle;
  EXPECT_FALSE(lifecycle.sleepFor(1ms));
}

}  // namespace tern::internal

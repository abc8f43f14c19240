// Beacon
// Copyright (C) 2022 Tim Hughey
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// https://www.wisslanding.com


#include "core/shutdown.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace beacon;
using namespace beacon::core;
using namespace std::chrono_literals;

class ShutdownCoordinatorTest : public ::testing::Test {
protected:
  using Wait = ShutdownCoordinator::Wait;

  ShutdownCoordinator coordinator;
};

TEST_F(ShutdownCoordinatorTest, StartsRunning) {
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::Running);
  EXPECT_FALSE(coordinator.shutdown_requested());
}

TEST_F(ShutdownCoordinatorTest, WaitTimesOutWhileRunning) {
  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(coordinator.wait_for_shutdown(50ms), Wait::Timeout);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(ShutdownCoordinatorTest, OnlyFirstRequestTransitions) {
  EXPECT_TRUE(coordinator.request_shutdown());
  EXPECT_FALSE(coordinator.request_shutdown());
  EXPECT_FALSE(coordinator.request_shutdown());

  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::ShutdownRequested);
}

TEST_F(ShutdownCoordinatorTest, RequestObservedImmediately) {
  coordinator.request_shutdown();

  const auto start = std::chrono::steady_clock::now();

  EXPECT_EQ(coordinator.wait_for_shutdown(5s), Wait::Shutdown);
  EXPECT_EQ(coordinator.wait_for_shutdown(), Wait::Shutdown);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(ShutdownCoordinatorTest, ConcurrentRequestsTransitionOnce) {
  constexpr auto requesters{16};
  std::atomic_int transitions{0};
  std::atomic_bool go{false};
  std::vector<std::thread> threads;

  for (auto i = 0; i < requesters; i++) {
    threads.emplace_back([&]() {
      while (!go.load()) std::this_thread::yield();

      if (coordinator.request_shutdown()) transitions++;
    });
  }

  go = true;

  for (auto &t : threads) t.join();

  EXPECT_EQ(transitions.load(), 1);
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::ShutdownRequested);
}

TEST_F(ShutdownCoordinatorTest, AllWaitersReleased) {
  constexpr auto waiters{8};
  std::atomic_int released{0};
  std::vector<std::thread> threads;

  for (auto i = 0; i < waiters; i++) {
    threads.emplace_back([&, i]() {
      // half wait without a limit, half with a generous one
      const auto rc = (i % 2) ? coordinator.wait_for_shutdown() : coordinator.wait_for_shutdown(10s);

      if (rc == Wait::Shutdown) released++;
    });
  }

  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(released.load(), 0);

  coordinator.request_shutdown();

  for (auto &t : threads) t.join();

  EXPECT_EQ(released.load(), waiters);
}

TEST_F(ShutdownCoordinatorTest, StoppedWakesStopWaiters) {
  EXPECT_EQ(coordinator.wait_for_stopped(20ms), Wait::Timeout);

  std::thread stopper([this]() {
    coordinator.request_shutdown();
    std::this_thread::sleep_for(20ms);
    coordinator.mark_stopped();
  });

  EXPECT_EQ(coordinator.wait_for_stopped(5s), Wait::Stopped);
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::Stopped);

  stopper.join();
}

TEST_F(ShutdownCoordinatorTest, RequestAfterStoppedIsNoop) {
  coordinator.request_shutdown();
  coordinator.mark_stopped();

  EXPECT_FALSE(coordinator.request_shutdown());
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::Stopped);
}

TEST(StateNameTest, Names) {
  EXPECT_EQ(state_name(ShutdownCoordinator::Running), "running");
  EXPECT_EQ(state_name(ShutdownCoordinator::ShutdownRequested), "shutdown_requested");
  EXPECT_EQ(state_name(ShutdownCoordinator::Stopped), "stopped");
}

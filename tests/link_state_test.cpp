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

#include "mdns/link_state.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace beacon;
using namespace beacon::mdns;
using namespace std::chrono_literals;

class LinkStateTest : public ::testing::Test {
protected:
  LinkState link;
};

TEST_F(LinkStateTest, StartsConnecting) {
  EXPECT_EQ(link.current(), LinkState::Connecting);
  EXPECT_FALSE(link.usable());
}

TEST_F(LinkStateTest, FirstRunningIsNotAFault) {
  EXPECT_FALSE(link.enter(LinkState::Registering, false).has_value());
  EXPECT_FALSE(link.enter(LinkState::Running, false).has_value());

  EXPECT_TRUE(link.usable());
}

TEST_F(LinkStateTest, DaemonLossReportedOnReturnToRunning) {
  link.enter(LinkState::Running, false);

  // no fault while the daemon is away, a re-publish would find no client
  EXPECT_FALSE(link.enter(LinkState::Connecting, true).has_value());
  EXPECT_FALSE(link.usable());
  EXPECT_FALSE(link.enter(LinkState::Registering, true).has_value());

  auto cause = link.enter(LinkState::Running, true);
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(*cause, "avahi-daemon connection lost");
  EXPECT_TRUE(link.usable());

  // reported exactly once
  EXPECT_FALSE(link.enter(LinkState::Running, true).has_value());
}

TEST_F(LinkStateTest, HostResetReportedOnReturnToRunning) {
  link.enter(LinkState::Running, true);
  link.enter(LinkState::Registering, true);

  auto cause = link.enter(LinkState::Running, true);
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(*cause, "avahi-daemon host records reset");
}

TEST_F(LinkStateTest, NothingPublishedNothingLost) {
  link.enter(LinkState::Running, false);
  link.enter(LinkState::Connecting, false);

  EXPECT_FALSE(link.enter(LinkState::Running, false).has_value());
}

TEST_F(LinkStateTest, FailureDropsPendingLoss) {
  link.enter(LinkState::Running, true);
  link.enter(LinkState::Connecting, true);
  link.enter(LinkState::Failed, true);

  EXPECT_EQ(link.current(), LinkState::Failed);
  EXPECT_FALSE(link.enter(LinkState::Running, true).has_value());
}

TEST_F(LinkStateTest, WaitTimesOutWhileConnecting) {
  const auto start = std::chrono::steady_clock::now();

  EXPECT_FALSE(link.wait_running(50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(LinkStateTest, WaitWakesOnRunning) {
  link.enter(LinkState::Running, true);
  link.enter(LinkState::Connecting, true);

  std::thread daemon([this]() {
    std::this_thread::sleep_for(20ms);
    link.enter(LinkState::Registering, true);
    link.enter(LinkState::Running, true);
  });

  EXPECT_TRUE(link.wait_running(5000ms));

  daemon.join();
}

TEST_F(LinkStateTest, WaitReturnsFalseOnFailure) {
  std::thread daemon([this]() {
    std::this_thread::sleep_for(20ms);
    link.enter(LinkState::Failed, false);
  });

  const auto start = std::chrono::steady_clock::now();

  EXPECT_FALSE(link.wait_running(5000ms));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5000ms);

  daemon.join();
}

TEST_F(LinkStateTest, PhaseNames) {
  EXPECT_EQ(phase_name(LinkState::Connecting), "connecting");
  EXPECT_EQ(phase_name(LinkState::Registering), "registering");
  EXPECT_EQ(phase_name(LinkState::Running), "running");
  EXPECT_EQ(phase_name(LinkState::Failed), "failed");
}

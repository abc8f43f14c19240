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

#include "base/elapsed.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace beacon;

TEST(ElapsedTest, HumanizeMillis) {
  EXPECT_EQ(Elapsed::humanize(Millis(0)), "0ms");
  EXPECT_EQ(Elapsed::humanize(Millis(500)), "500ms");
}

TEST(ElapsedTest, HumanizeSecondsKeepsFraction) {
  EXPECT_EQ(Elapsed::humanize(Millis(12340)), "12.34s");
  EXPECT_EQ(Elapsed::humanize(Millis(45600)), "45.60s");
  EXPECT_EQ(Elapsed::humanize(Millis(1000)), "1.00s");
}

TEST(ElapsedTest, HumanizeMinutes) {
  EXPECT_EQ(Elapsed::humanize(Seconds(80)), "1m 20s");
  EXPECT_EQ(Elapsed::humanize(Seconds(3600 + 5)), "60m 5s");
}

TEST(ElapsedTest, MeasuresForward) {
  Elapsed e;

  std::this_thread::sleep_for(5ms);

  EXPECT_GE(e.as<Millis>(), 5ms);
}

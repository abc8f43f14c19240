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

#include <fmt/format.h>
#include <iterator>
#include <time.h>

namespace beacon {

Nanos Elapsed::monotonic() noexcept { // static
  struct timespec tn;
  clock_gettime(CLOCK_MONOTONIC_RAW, &tn);

  return Nanos(static_cast<int64_t>(tn.tv_sec) * 1'000'000'000 + tn.tv_nsec);
}

string Elapsed::humanize(Nanos d) noexcept { // static
  string msg;
  auto w = std::back_inserter(msg);

  auto ms = std::chrono::duration_cast<Millis>(d);

  if (ms < 1s) {
    fmt::format_to(w, "{}ms", ms.count());
  } else if (ms < 1min) {
    fmt::format_to(w, "{:.2f}s", std::chrono::duration<double>(ms).count());
  } else {
    const auto mins = std::chrono::duration_cast<std::chrono::minutes>(ms);
    const auto secs = std::chrono::duration_cast<Seconds>(ms - mins);

    fmt::format_to(w, "{}m {}s", mins.count(), secs.count());
  }

  return msg;
}

} // namespace beacon

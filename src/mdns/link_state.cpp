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
#include "base/logger.hpp"

namespace beacon {
namespace mdns {

std::optional<string> LinkState::enter(Phase next, bool published) noexcept {
  INFO_AUTO_CAT("enter");

  std::optional<string> cause;
  std::unique_lock lck(mtx);

  const auto prev = phase;

  switch (next) {
  case Connecting:
  case Registering: {
    // only the first loss is kept, Connecting is usually followed by Registering
    if (was_running && published && lost_cause.empty()) {
      lost_cause.assign(next == Connecting ? "avahi-daemon connection lost"
                                           : "avahi-daemon host records reset");
    }
  } break;

  case Running: {
    was_running = true;

    if (!lost_cause.empty()) {
      cause.emplace(std::move(lost_cause));
      lost_cause.clear();
    }
  } break;

  case Failed: {
    lost_cause.clear();
  } break;
  }

  phase = next;
  lck.unlock();

  cv.notify_all();

  if (prev != next) INFO_AUTO("{} -> {}", phase_name(prev), phase_name(next));

  return cause;
}

LinkState::Phase LinkState::current() const noexcept {
  std::unique_lock lck(mtx);

  return phase;
}

bool LinkState::wait_running(Millis timeout) noexcept {
  std::unique_lock lck(mtx);

  cv.wait_for(lck, timeout, [this]() { return (phase == Running) || (phase == Failed); });

  return phase == Running;
}

csv phase_name(LinkState::Phase phase) noexcept {
  switch (phase) {
  case LinkState::Connecting:
    return "connecting";
  case LinkState::Registering:
    return "registering";
  case LinkState::Running:
    return "running";
  case LinkState::Failed:
    return "failed";
  }

  return "unknown";
}

} // namespace mdns
} // namespace beacon

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

#pragma once

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace beacon {
namespace mdns {

/// @brief Connection state of the local mDNS responder as seen by the client.
///        Records published while the responder drops out are reported once
///        the responder is running again, when a re-publish can succeed.
///        All members are safe to call from any thread.
class LinkState {
public:
  enum Phase : uint8_t { Connecting = 0, Registering, Running, Failed };

public:
  LinkState() = default;
  LinkState(const LinkState &) = delete;
  LinkState(LinkState &&) = delete;

  /// @brief Record a transition reported by the responder
  /// @param published true when committed records exist at the time of the transition
  /// @return fault cause when the transition completes a loss and recovery
  std::optional<string> enter(Phase next, bool published) noexcept;

  Phase current() const noexcept;

  bool usable() const noexcept { return current() == Running; }

  /// @brief Block until Running or Failed, or the timeout expires
  /// @return true when Running
  bool wait_running(Millis timeout) noexcept;

private:
  mutable std::mutex mtx;
  std::condition_variable cv;
  Phase phase{Connecting};
  bool was_running{false};
  string lost_cause;

public:
  MOD_ID("mdns.link");
};

csv phase_name(LinkState::Phase phase) noexcept;

} // namespace mdns
} // namespace beacon

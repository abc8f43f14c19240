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

namespace beacon {
namespace core {

/// @brief One shot, one way shutdown signal: Running -> ShutdownRequested -> Stopped.
///        All members are safe to call from any thread.
class ShutdownCoordinator {
public:
  enum State : uint8_t { Running = 0, ShutdownRequested, Stopped };
  enum class Wait : uint8_t { Shutdown = 0, Stopped, Timeout };

public:
  ShutdownCoordinator() = default;
  ShutdownCoordinator(const ShutdownCoordinator &) = delete;
  ShutdownCoordinator(ShutdownCoordinator &&) = delete;

  /// @brief Request shutdown
  /// @return true only for the call that made the transition
  bool request_shutdown() noexcept;

  /// @brief Block until shutdown is requested or the timeout expires
  Wait wait_for_shutdown(Millis timeout) noexcept;

  /// @brief Block until shutdown is requested
  Wait wait_for_shutdown() noexcept;

  /// @brief Cleanup finished, wakes wait_for_stopped() callers
  void mark_stopped() noexcept;

  /// @brief Block until mark_stopped() or the timeout expires
  Wait wait_for_stopped(Millis timeout) noexcept;

  State state() const noexcept;

  bool shutdown_requested() const noexcept { return state() != Running; }

private:
  mutable std::mutex mtx;
  std::condition_variable cv;
  State _state{Running};

public:
  MOD_ID("core.shutdown");
};

csv state_name(ShutdownCoordinator::State state) noexcept;

} // namespace core
} // namespace beacon

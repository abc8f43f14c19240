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
#include "base/logger.hpp"

namespace beacon {
namespace core {

bool ShutdownCoordinator::request_shutdown() noexcept {
  INFO_AUTO_CAT("request");

  std::unique_lock lck(mtx);

  if (_state != Running) return false;

  _state = ShutdownRequested;
  lck.unlock();

  cv.notify_all();

  INFO_AUTO("shutdown requested");

  return true;
}

ShutdownCoordinator::Wait ShutdownCoordinator::wait_for_shutdown(Millis timeout) noexcept {
  std::unique_lock lck(mtx);

  return cv.wait_for(lck, timeout, [this]() { return _state != Running; }) ? Wait::Shutdown
                                                                           : Wait::Timeout;
}

ShutdownCoordinator::Wait ShutdownCoordinator::wait_for_shutdown() noexcept {
  std::unique_lock lck(mtx);

  cv.wait(lck, [this]() { return _state != Running; });

  return Wait::Shutdown;
}

void ShutdownCoordinator::mark_stopped() noexcept {
  {
    std::unique_lock lck(mtx);
    _state = Stopped;
  }

  cv.notify_all();
}

ShutdownCoordinator::Wait ShutdownCoordinator::wait_for_stopped(Millis timeout) noexcept {
  std::unique_lock lck(mtx);

  return cv.wait_for(lck, timeout, [this]() { return _state == Stopped; }) ? Wait::Stopped
                                                                           : Wait::Timeout;
}

ShutdownCoordinator::State ShutdownCoordinator::state() const noexcept {
  std::unique_lock lck(mtx);

  return _state;
}

csv state_name(ShutdownCoordinator::State state) noexcept {
  switch (state) {
  case ShutdownCoordinator::Running:
    return "running";
  case ShutdownCoordinator::ShutdownRequested:
    return "shutdown_requested";
  case ShutdownCoordinator::Stopped:
    return "stopped";
  }

  return "unknown";
}

} // namespace core
} // namespace beacon

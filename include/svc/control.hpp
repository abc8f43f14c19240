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

#include "base/error.hpp"
#include "base/types.hpp"
#include "core/service_host.hpp"

#include <filesystem>
#include <functional>

namespace beacon {
namespace svc {

using fs_path = std::filesystem::path;

/// @brief Start and stop events delivered by the service manager
struct Handler {
  std::function<int()> start; // runs the service, returns the exit code
  std::function<void()> stop; // may be called from any thread
};

/// @brief Host service manager seam (install, uninstall, status and the
///        service-mode entry point)
class Control {
public:
  virtual ~Control() noexcept = default;

  /// @brief Register the service with the manager
  /// @param exe absolute path of the executable to run
  /// @param cfg_file configuration the installed service will load
  virtual result<void, ServiceControlError> install(const fs_path &exe,
                                                    const fs_path &cfg_file) noexcept = 0;

  virtual result<void, ServiceControlError> uninstall() noexcept = 0;

  /// @brief Manager reported state of the service (e.g. active, inactive)
  virtual result<string, ServiceControlError> status() noexcept = 0;

  /// @brief Service-mode entry.  Calls handler.start on the calling thread and
  ///        handler.stop when the manager asks the service to stop.
  /// @return exit code returned by handler.start
  virtual int dispatch(csv name, Handler handler) noexcept = 0;

  /// @brief Acknowledge a state change to the manager
  virtual void report(core::ServiceHost::State state) noexcept = 0;
};

} // namespace svc
} // namespace beacon

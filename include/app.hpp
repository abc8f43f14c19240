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

#include "base/types.hpp"
#include "core/service_host.hpp"
#include "mdns/backend.hpp"

#include <memory>

namespace beacon {

class App {
public:
  /// @brief Construct the App object.  CLI arguments have already been
  ///        handled and the logger is running.
  App() noexcept = default;

  /// @brief Similar to 'C' main.  Executes the command given on the
  ///        command line and returns the process exit code.
  int main() noexcept;

private:
  int discover() noexcept;
  int install() noexcept;
  int run() noexcept;
  int service() noexcept;
  int status() noexcept;
  int uninstall() noexcept;

  /// @brief Log the error and map it to the process exit code
  int failed(const Error &err) noexcept;

  static core::ServiceHost::Opts host_opts() noexcept;

public:
  MOD_ID("app");
};

} // namespace beacon

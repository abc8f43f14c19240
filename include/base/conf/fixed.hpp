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

#include <filesystem>

namespace beacon {
namespace conf {

struct fixed {

  using fs_path = std::filesystem::path;

  /// @brief Application name from CMakeList project definition (e.g. beacon)
  /// @return constant string view
  static csv app_name() noexcept;

  /// @brief Full path and filename of the JSON configuration file as
  ///        determined by cli args (or build default)
  static fs_path cfg_file() noexcept;

  /// @brief Command requested on the command line (e.g. run)
  static string command() noexcept;

  /// @brief Log messages in the debug category
  static bool debug() noexcept;

  /// @brief How long discover browses
  static Seconds discover_secs() noexcept;

  /// @brief Absolute path of the running executable
  static fs_path exec_path() noexcept;

  /// @brief Git describe as determined at build time
  /// @return string
  static string git() noexcept;

  /// @brief Time allowed for unregister during shutdown
  static Millis grace() noexcept;

  /// @brief Log file path determined using cli args or build default
  /// @return modifiable std::filesystem::path
  static fs_path log_file() noexcept;

  /// @brief Release version from the CMakeList project definition (e.g. 1.0.0)
  static csv version() noexcept;
};

} // namespace conf
} // namespace beacon

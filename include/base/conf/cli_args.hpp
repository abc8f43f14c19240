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

#include "base/conf/keys.hpp"
#include "base/types.hpp"

#include <sstream>
#include <toml++/toml.h>

namespace beacon {
namespace conf {

/// @brief Parses the command line once, from main() and before the logger
///        exists.  Parsed values land in a toml table read through conf::fixed.
struct cli_args {

  friend struct fixed;

  cli_args(int argc, char **argv) noexcept;

  static bool help() noexcept { return help_requested; }
  static const string &error_msg() noexcept { return error_str; }

  /// @brief Proceed with startup: a known command, no --help and no parse error
  static bool nominal_start() noexcept { return !help_requested && error_str.empty(); }

  /// @brief Option descriptions followed by the command list
  static string usage() noexcept { return usage_ss.str(); }

  /// @brief run, install, uninstall, status, service (discover in debug builds)
  static bool known_command(csv command) noexcept;

protected:
  static toml::table ttable;

private:
  static string error_str;
  static bool help_requested;
  static std::ostringstream usage_ss;
};

} // namespace conf
} // namespace beacon

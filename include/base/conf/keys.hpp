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

namespace beacon {
namespace conf {

struct key {
  static constexpr auto cfg_file{"config"};
  static constexpr auto command{"command"};
  static constexpr auto debug{"debug"};
  static constexpr auto discover_secs{"discover-secs"};
  static constexpr auto exec_path{"exec-path"};
  static constexpr auto grace_ms{"grace-ms"};
  static constexpr auto help{"help"};
  static constexpr auto log_file{"log-file"};
};

struct cmd {
  static constexpr auto run{"run"};
  static constexpr auto install{"install"};
  static constexpr auto uninstall{"uninstall"};
  static constexpr auto status{"status"};
  static constexpr auto service{"service"};
  static constexpr auto discover{"discover"};
};

} // namespace conf
} // namespace beacon

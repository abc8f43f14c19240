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


#include "base/conf/fixed.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

#include <filesystem>

namespace beacon {
namespace conf {

using fs_path = std::filesystem::path;

csv fixed::app_name() noexcept { return build::info.project; }

fs_path fixed::cfg_file() noexcept { return cli_args::ttable[key::cfg_file].ref<string>(); }

string fixed::command() noexcept { return cli_args::ttable[key::command].value_or(string()); }

bool fixed::debug() noexcept { return cli_args::ttable[key::debug].value_or(false); }

Seconds fixed::discover_secs() noexcept {
  return Seconds(cli_args::ttable[key::discover_secs].value_or(int64_t{10}));
}

fs_path fixed::exec_path() noexcept { return cli_args::ttable[key::exec_path].ref<string>(); }

string fixed::git() noexcept { return build::info.git; }

Millis fixed::grace() noexcept {
  return Millis(cli_args::ttable[key::grace_ms].value_or(int64_t{5000}));
}

fs_path fixed::log_file() noexcept { return cli_args::ttable[key::log_file].ref<string>(); }

csv fixed::version() noexcept { return build::info.version; }

} // namespace conf
} // namespace beacon

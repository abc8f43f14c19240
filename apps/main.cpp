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


#include "app.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/logger.hpp"

#include <cstdlib>
#include <fmt/format.h>

int main(int argc, char *argv[]) {
  using namespace beacon;

  int rc{exit_code::usage}; // exit code, default to usage

  // handle cli args
  conf::cli_args(argc, argv);

  if (conf::cli_args::nominal_start()) {
    // all is well, proceed with app startup
    Logger::create(conf::fixed::log_file().string(), conf::fixed::debug());

    rc = App().main();

    Logger::shutdown();

  } else if (conf::cli_args::help()) {
    fmt::print("{}", conf::cli_args::usage());
    rc = exit_code::ok;

  } else {
    // bad args or no command
    fmt::print(stderr, "{}\n\n{}", conf::cli_args::error_msg(), conf::cli_args::usage());
  }

  exit(rc);
}

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


#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/types.hpp"
#include "build_inject.hpp"

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/std.h>

namespace beacon {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

constexpr auto def_cfg_file{"config.json"};
constexpr auto def_log_file{"/dev/stdout"};
constexpr int64_t def_grace_ms{5000};
constexpr int64_t def_discover_secs{10};

constexpr auto desc_cfg_file{"JSON service configuration file"};
constexpr auto desc_command{"run | install | uninstall | status | service"};
constexpr auto desc_debug{"include debug category log messages"};
constexpr auto desc_discover_secs{"seconds to browse (discover)"};
constexpr auto desc_grace_ms{"milliseconds allowed for unregister at shutdown"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_log_file{"full path to log file"};

toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
std::ostringstream cli_args::usage_ss;

bool cli_args::known_command(csv command) noexcept {
  static constexpr std::array commands{
      csv{cmd::run}, csv{cmd::install}, csv{cmd::uninstall}, csv{cmd::status}, csv{cmd::service},
#ifndef NDEBUG
      csv{cmd::discover},
#endif
  };

  return std::any_of(commands.begin(), commands.end(), [=](csv c) { return c == command; });
}

cli_args::cli_args(int argc, char **argv) noexcept {
  fs_path fs_arg0{argv[0]};

  // the installed unit needs the real executable, not how we were invoked
  std::error_code ec;
  if (auto self = fs::read_symlink("/proc/self/exe", ec); !ec) {
    ttable.insert_or_assign(key::exec_path, self.string());
  } else {
    ttable.insert_or_assign(key::exec_path, fs::absolute(fs_arg0, ec).string());
  }

  auto def_cfg_fs_file = fs_path(build::info.sysconf_dir) / build::info.project / def_cfg_file;

  po::options_description desc(
      fmt::format("{} {} [options] <command>", build::info.project, build::info.version));

  auto cfg_file_v = po::value<string>()
                        ->notifier([](const string p) {
                          fs_path p_fs(p);
                          std::error_code ec;

                          if (p_fs.is_relative()) p_fs = fs::absolute(p_fs, ec);

                          ttable.insert_or_assign(key::cfg_file, p_fs.string());
                        })
                        ->default_value(def_cfg_fs_file.string());

  auto log_file_v =
      po::value<string>()
          ->notifier([](const string f) { ttable.insert_or_assign(key::log_file, f); })
          ->default_value(def_log_file);

  auto grace_v = po::value<int64_t>()
                     ->notifier([](int64_t ms) {
                       if (ms < 0) throw po::error("--grace-ms must not be negative");
                       ttable.insert_or_assign(key::grace_ms, ms);
                     })
                     ->default_value(def_grace_ms);

  auto discover_v = po::value<int64_t>()
                        ->notifier([](int64_t secs) {
                          if (secs < 1) throw po::error("--discover-secs must be at least 1");
                          ttable.insert_or_assign(key::discover_secs, secs);
                        })
                        ->default_value(def_discover_secs);

  auto debug_v = po::bool_switch()
                     ->notifier([](bool e) { ttable.insert_or_assign(key::debug, e); })
                     ->default_value(false);

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  auto command_v = po::value<string>()->notifier(
      [](const string c) { ttable.insert_or_assign(key::command, c); });

  desc.add_options()                                              //
      ("config,c", cfg_file_v, desc_cfg_file)                     //
      (key::log_file, log_file_v, desc_log_file)                  //
      (key::grace_ms, grace_v, desc_grace_ms)                     //
      (key::discover_secs, discover_v, desc_discover_secs)        //
      (key::debug, debug_v, desc_debug)                           //
      ("help,h", help_v, desc_help);                              //

  // the command is positional, hidden from the option list
  po::options_description hidden;
  hidden.add_options()(key::command, command_v, desc_command);

  po::options_description all;
  all.add(desc).add(hidden);

  po::positional_options_description positional;
  positional.add(key::command, 1);

  usage_ss << desc << "\ncommands:\n"
          << "  run         advertise in the foreground until SIGINT/SIGTERM\n"
          << "  install     install and enable the systemd unit (root)\n"
          << "  uninstall   disable and remove the systemd unit (root)\n"
          << "  status      systemd state of the installed unit\n"
          << "  service     entry point used by the systemd unit\n"
#ifndef NDEBUG
          << "  discover    browse for the configured service type and log results\n"
#endif
      ;

  try {
    po::variables_map args;

    // this will throw if parsing fails
    auto parsed_opts = po::command_line_parser(argc, argv).options(all).positional(positional).run();

    // good, we parsed command line args, store them
    po::store(parsed_opts, args);

    // notify all args (populate toml table)
    po::notify(args);

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;
    return;
  }

  if (!error_str.empty()) return;

  if (const auto command = ttable[key::command].value_or(string()); command.empty()) {
    error_str = "a command is required";
  } else if (!known_command(command)) {
    error_str = fmt::format("unknown command '{}'", command);
  }
}

} // namespace conf
} // namespace beacon

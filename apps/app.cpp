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
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/logger.hpp"
#include "base/signals.hpp"
#include "conf/service_config.hpp"
#include "mdns/avahi.hpp"
#include "net/adapter.hpp"
#include "svc/systemd.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <fmt/std.h>
#include <memory>

namespace beacon {

namespace fs = std::filesystem;

int App::main() noexcept {
  INFO_AUTO_CAT("main");

  const auto command = conf::fixed::command();

  INFO_INIT("{} {} ({}) command={} config={}", conf::fixed::app_name(), conf::fixed::version(),
            conf::fixed::git(), command, conf::fixed::cfg_file());

  if (command == conf::cmd::run) return run();
  if (command == conf::cmd::install) return install();
  if (command == conf::cmd::uninstall) return uninstall();
  if (command == conf::cmd::status) return status();
  if (command == conf::cmd::service) return service();

#ifndef NDEBUG
  if (command == conf::cmd::discover) return discover();
#endif

  INFO_AUTO("unhandled command={}", command);
  return exit_code::usage;
}

int App::failed(const Error &err) noexcept {
  INFO_AUTO_CAT("failed");

  INFO_AUTO("{}", describe(err));

  return exit_code_for(err);
}

core::ServiceHost::Opts App::host_opts() noexcept {
  return core::ServiceHost::Opts{.cfg_file = conf::fixed::cfg_file(),
                                 .grace = conf::fixed::grace(),
                                 .tick = Millis(250),
                                 .cfg = std::nullopt};
}

int App::discover() noexcept {
  INFO_AUTO_CAT("discover");

  auto cfg = conf::ServiceConfig::load(conf::fixed::cfg_file());
  if (!cfg) return failed(cfg.error());

  mdns::AvahiBackend backend;
  const auto found = backend.browse(cfg.value().service_type, conf::fixed::discover_secs());

  for (const auto &f : found) {
    INFO_AUTO("{}", f.inspect());
  }

  INFO_AUTO("found {} {} service(s)", found.size(), cfg.value().service_type);

  return exit_code::ok;
}

int App::install() noexcept {
  INFO_AUTO_CAT("install");

  const auto cfg_file = conf::fixed::cfg_file();
  svc::SystemdControl control(conf::fixed::app_name());

  if (auto rc = control.install(conf::fixed::exec_path(), cfg_file); !rc) {
    return failed(rc.error());
  }

  std::error_code ec;
  if (!fs::exists(cfg_file, ec)) {
    if (auto rc = conf::ServiceConfig::defaults().save(cfg_file); !rc) return failed(rc.error());

    INFO_AUTO("wrote default configuration {}, edit before starting", cfg_file);
  }

  return exit_code::ok;
}

int App::run() noexcept {
  core::ServiceHost host(host_opts(), std::make_shared<mdns::AvahiBackend>(),
                         std::make_shared<net::SystemAdapters>());

  // SIGINT or SIGTERM requests shutdown, run() finishes cleanup
  SignalWatch signals([&host](int) { host.on_stop(); });

  return host.run();
}

int App::service() noexcept {
  const auto app_name = conf::fixed::app_name();

  svc::SystemdControl control(app_name);
  core::ServiceHost host(host_opts(), std::make_shared<mdns::AvahiBackend>(),
                         std::make_shared<net::SystemAdapters>());

  host.observe([&control](core::ServiceHost::State state) { control.report(state); });

  return control.dispatch(app_name, svc::Handler{.start = [&host]() { return host.on_start(); },
                                                 .stop = [&host]() { host.on_stop(); }});
}

int App::status() noexcept {
  svc::SystemdControl control(conf::fixed::app_name());

  auto rc = control.status();
  if (!rc) return failed(rc.error());

  fmt::print("{}: {}\n", conf::fixed::app_name(), rc.value());

  return exit_code::ok;
}

int App::uninstall() noexcept {
  INFO_AUTO_CAT("uninstall");

  svc::SystemdControl control(conf::fixed::app_name());

  if (auto rc = control.uninstall(); !rc) return failed(rc.error());

  INFO_AUTO("removed, configuration {} was kept", conf::fixed::cfg_file());

  return exit_code::ok;
}

} // namespace beacon

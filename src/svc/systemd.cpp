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

#include "svc/systemd.hpp"
#include "base/logger.hpp"
#include "base/signals.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>
#include <fmt/os.h>
#include <fmt/std.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <systemd/sd-daemon.h>
#include <unistd.h>

namespace beacon {
namespace svc {

namespace fs = std::filesystem;

namespace {

auto backend_error(string cause) noexcept {
  return outcome::failure(ServiceControlError{ServiceControlError::Backend, std::move(cause)});
}

} // namespace

result<void, ServiceControlError> SystemdControl::require_root() noexcept {
  if (geteuid() != 0) {
    return outcome::failure(ServiceControlError{ServiceControlError::PermissionDenied,
                                                "must be run as root (euid 0)"});
  }

  return outcome::success();
}

result<SystemdControl::Output, ServiceControlError>
SystemdControl::systemctl(std::vector<string> args) noexcept {
  INFO_AUTO_CAT("systemctl");

  args.insert(args.begin(), "systemctl");

  std::array<int, 2> pipe_fds{-1, -1};
  if (::pipe(pipe_fds.data()) != 0) return backend_error(fmt::format("pipe: {}", std::strerror(errno)));

  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  auto child_pid = ::fork();

  if (child_pid < 0) { // fork failed
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);

    return backend_error(fmt::format("fork: {}", std::strerror(errno)));
  }

  if (child_pid == 0) { // child, stdout and stderr to the pipe
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::dup2(pipe_fds[1], STDERR_FILENO);
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);

    ::execvp(argv[0], argv.data());
    std::perror("execvp systemctl");
    std::_Exit(127);
  }

  ::close(pipe_fds[1]);

  Output out;
  std::array<char, 512> buff;

  for (auto n = ::read(pipe_fds[0], buff.data(), buff.size()); n != 0;
       n = ::read(pipe_fds[0], buff.data(), buff.size())) {
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }

    out.text.append(buff.data(), static_cast<size_t>(n));
  }

  ::close(pipe_fds[0]);

  int wstatus{0};
  while (::waitpid(child_pid, &wstatus, 0) < 0) {
    if (errno != EINTR) return backend_error(fmt::format("waitpid: {}", std::strerror(errno)));
  }

  out.status = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : 128;

  while (!out.text.empty() && ((out.text.back() == '\n') || (out.text.back() == ' '))) {
    out.text.pop_back();
  }

  INFO("debug", "{} status={} output='{}'", fmt::join(args, " "), out.status, out.text);

  return outcome::success(std::move(out));
}

result<void, ServiceControlError> SystemdControl::systemctl_ok(std::vector<string> args) noexcept {
  const auto cmd = fmt::format("systemctl {}", fmt::join(args, " "));

  auto rc = systemctl(std::move(args));
  if (!rc) return outcome::failure(rc.error());

  if (rc.value().status != 0) {
    return backend_error(fmt::format("{} exited {}: {}", cmd, rc.value().status, rc.value().text));
  }

  return outcome::success();
}

string SystemdControl::unit_text(csv name, const fs_path &exe, const fs_path &cfg_file) noexcept {
  return fmt::format("[Unit]\n"
                     "Description={} mDNS SMB share advertiser\n"
                     "Wants=network-online.target\n"
                     "After=network-online.target avahi-daemon.service\n"
                     "Requires=avahi-daemon.service\n"
                     "\n"
                     "[Service]\n"
                     "Type=notify\n"
                     "NotifyAccess=main\n"
                     "ExecStart={} --config {} service\n"
                     "Restart=on-failure\n"
                     "RestartSec=5\n"
                     "\n"
                     "[Install]\n"
                     "WantedBy=multi-user.target\n",
                     name, exe.string(), cfg_file.string());
}

result<void, ServiceControlError> SystemdControl::install(const fs_path &exe,
                                                          const fs_path &cfg_file) noexcept {
  INFO_AUTO_CAT("install");

  if (auto rc = require_root(); !rc) return rc;

  std::error_code ec;
  if (fs::exists(unit_file, ec)) {
    return outcome::failure(
        ServiceControlError{ServiceControlError::AlreadyInstalled, fmt::format("{}", unit_file)});
  }

  try {
    constexpr auto flags = fmt::file::WRONLY | fmt::file::CREATE | fmt::file::TRUNC;
    auto os = fmt::output_file(unit_file.string(), flags);

    os.print("{}", unit_text(name, exe, cfg_file));
    os.close();

  } catch (const std::system_error &err) {
    return backend_error(fmt::format("unable to write {}: {}", unit_file, err.what()));
  }

  INFO_AUTO("wrote {}", unit_file);

  if (auto rc = systemctl_ok({"daemon-reload"}); !rc) return rc;
  if (auto rc = systemctl_ok({"enable", name}); !rc) return rc;

  INFO_AUTO("{} enabled, start with: systemctl start {}", name, name);

  return outcome::success();
}

result<void, ServiceControlError> SystemdControl::uninstall() noexcept {
  INFO_AUTO_CAT("uninstall");

  if (auto rc = require_root(); !rc) return rc;

  std::error_code ec;
  if (!fs::exists(unit_file, ec)) {
    return outcome::failure(
        ServiceControlError{ServiceControlError::NotInstalled, fmt::format("{}", unit_file)});
  }

  if (auto rc = systemctl_ok({"disable", "--now", name}); !rc) return rc;

  if (!fs::remove(unit_file, ec) || ec) {
    return backend_error(fmt::format("unable to remove {}: {}", unit_file, ec.message()));
  }

  INFO_AUTO("removed {}", unit_file);

  return systemctl_ok({"daemon-reload"});
}

result<string, ServiceControlError> SystemdControl::status() noexcept {
  std::error_code ec;
  if (!fs::exists(unit_file, ec)) {
    return outcome::failure(
        ServiceControlError{ServiceControlError::NotInstalled, fmt::format("{}", unit_file)});
  }

  // is-active exits non-zero for anything but active, the text is the answer
  auto rc = systemctl({"is-active", name});
  if (!rc) return outcome::failure(rc.error());

  return outcome::success(std::move(rc).value().text);
}

int SystemdControl::dispatch(csv name, Handler handler) noexcept {
  INFO_AUTO_CAT("dispatch");

  INFO_AUTO("{} service mode, notify_socket={}", name, std::getenv("NOTIFY_SOCKET") ? "yes" : "no");

  // systemd stops the service with SIGTERM
  SignalWatch signals([&handler](int) { handler.stop(); });

  return handler.start();
}

csv SystemdControl::notify_message(core::ServiceHost::State state) noexcept { // static
  switch (state) {
  case core::ServiceHost::Starting:
    return "STATUS=starting"sv;
  case core::ServiceHost::Running:
    return "READY=1\nSTATUS=advertising"sv;
  case core::ServiceHost::StopPending:
    return "STOPPING=1"sv;
  case core::ServiceHost::Stopped:
    return "STATUS=stopped"sv;
  }

  return "STATUS=unknown"sv;
}

void SystemdControl::report(core::ServiceHost::State state) noexcept {
  INFO_AUTO_CAT("report");

  const auto msg = notify_message(state);

  // msg views string literals, null terminated
  if (auto rc = sd_notify(0, msg.data()); rc < 0) {
    INFO_AUTO("sd_notify failed, reason={}", std::strerror(-rc));
  }
}

} // namespace svc
} // namespace beacon

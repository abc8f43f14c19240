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
#include "svc/control.hpp"

#include <vector>

namespace beacon {
namespace svc {

class SystemdControl : public Control {
public:
  SystemdControl(csv name, fs_path unit_dir = def_unit_dir) noexcept
      : name(name), unit_file(unit_dir / fmt_unit(name)) {}

  result<void, ServiceControlError> install(const fs_path &exe,
                                            const fs_path &cfg_file) noexcept override;
  result<void, ServiceControlError> uninstall() noexcept override;
  result<string, ServiceControlError> status() noexcept override;
  int dispatch(csv name, Handler handler) noexcept override;
  void report(core::ServiceHost::State state) noexcept override;

  /// @brief Contents of the unit file
  static string unit_text(csv name, const fs_path &exe, const fs_path &cfg_file) noexcept;

  /// @brief sd_notify message announcing a host state
  static csv notify_message(core::ServiceHost::State state) noexcept;

  const fs_path &unit_path() const noexcept { return unit_file; }

private:
  static string fmt_unit(csv name) noexcept { return string(name).append(".service"); }

  static result<void, ServiceControlError> require_root() noexcept;

  struct Output {
    int status{0};
    string text;
  };

  /// @brief fork/exec systemctl, capturing stdout and stderr
  static result<Output, ServiceControlError> systemctl(std::vector<string> args) noexcept;

  /// @brief systemctl that must exit zero
  static result<void, ServiceControlError> systemctl_ok(std::vector<string> args) noexcept;

private:
  const string name;
  const fs_path unit_file;

public:
  static inline const fs_path def_unit_dir{"/etc/systemd/system"};

public:
  MOD_ID("svc.systemd");
};

} // namespace svc
} // namespace beacon

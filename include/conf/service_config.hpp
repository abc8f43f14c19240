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

#include <filesystem>
#include <optional>
#include <vector>

namespace beacon {
namespace conf {

struct ShareDefinition {
  string name;
  string path;
  string comment;

  bool operator==(const ShareDefinition &) const = default;
};

using Shares = std::vector<ShareDefinition>;

/// @brief Immutable description of the service to advertise.  Loaded once
///        at startup, never reloaded.
struct ServiceConfig {
  using fs_path = std::filesystem::path;

  string service_type;  // e.g. _smb._tcp.local.
  string instance_name; // DNS-SD instance label
  Port port{0};
  string hostname; // always <label>.local (no trailing dot)
  string workgroup{def_workgroup};
  string description;
  std::optional<string> bind_address; // IPv4 literal override
  Shares shares;

  bool operator==(const ServiceConfig &) const = default;

  /// @brief Hostname as a fully qualified domain name (trailing dot)
  string hostname_fqdn() const noexcept { return hostname + "."; }

  /// @brief Stock configuration written at install when no config exists
  static ServiceConfig defaults() noexcept;

  /// @brief Read, parse and validate the configuration file
  /// @param file full path to the JSON configuration
  /// @return validated config or ConfigError (NotFound, Malformed, Invalid)
  static result<ServiceConfig, ConfigError> load(const fs_path &file) noexcept;

  /// @brief Parse and validate JSON text, no filesystem access
  static result<ServiceConfig, ConfigError> parse(csv json) noexcept;

  /// @brief Apply validation rules in order, first failure wins.
  ///        The hostname is normalized to <label>.local
  static result<ServiceConfig, ConfigError> validated(ServiceConfig raw) noexcept;

  /// @brief Serialize as pretty printed JSON (bind_address omitted when unset)
  string to_json() const noexcept;

  /// @brief Validate then write to file, creating parent directories
  result<void, ConfigError> save(const fs_path &file) const noexcept;

  static constexpr csv def_hostname{"beacon.local"};
  static constexpr csv def_workgroup{"WORKGROUP"};
  static constexpr size_t max_instance_name{63};
  static constexpr size_t max_json_capacity{1024 * 1024};
};

/// @brief Normalize a hostname to <label>.local, nullopt when the label
///        is empty or not a valid DNS label
std::optional<string> normalize_hostname(csv raw) noexcept;

/// @brief First label of the system host name as <label>.local, or
///        beacon.local when the system name is not a usable label
string default_hostname() noexcept;

/// @brief Does the service type match _<label>._tcp.local. or _<label>._udp.local.
bool valid_service_type(csv stype) noexcept;

} // namespace conf
} // namespace beacon

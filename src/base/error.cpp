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

#include "base/error.hpp"

#include <array>
#include <fmt/format.h>
#include <iterator>

namespace beacon {

int exit_code_for(const Error &err) noexcept {
  return std::visit(overloaded{
                        [](const ConfigError &) { return exit_code::config; },
                        [](const AdapterError &) { return exit_code::adapter; },
                        [](const RegistrationError &) { return exit_code::registration; },
                        [](const ServiceControlError &) { return exit_code::service_control; },
                    },
                    err);
}

csv kind_name(ConfigError::Kind kind) noexcept {
  static constexpr std::array names{"NotFound"sv, "Malformed"sv, "Invalid"sv};
  return names[kind];
}

csv kind_name(AdapterError::Kind kind) noexcept {
  static constexpr std::array names{"NoSuitableAdapter"sv, "InvalidOverride"sv};
  return names[kind];
}

csv kind_name(RegistrationError::Kind kind) noexcept {
  static constexpr std::array names{"TxtTooLarge"sv, "AlreadyRegistered"sv, "Backend"sv};
  return names[kind];
}

csv kind_name(ServiceControlError::Kind kind) noexcept {
  static constexpr std::array names{"PermissionDenied"sv, "AlreadyInstalled"sv,
                                    "NotInstalled"sv, "Backend"sv};
  return names[kind];
}

string describe(const ConfigError &err) noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "config {}", kind_name(err.kind));

  if (!err.field.empty()) fmt::format_to(w, " field={}", err.field);
  if (!err.detail.empty()) fmt::format_to(w, " ({})", err.detail);

  return msg;
}

string describe(const AdapterError &err) noexcept {
  return err.detail.empty() ? fmt::format("adapter {}", kind_name(err.kind))
                            : fmt::format("adapter {} ({})", kind_name(err.kind), err.detail);
}

string describe(const RegistrationError &err) noexcept {
  return err.cause.empty() ? fmt::format("registration {}", kind_name(err.kind))
                           : fmt::format("registration {} ({})", kind_name(err.kind), err.cause);
}

string describe(const ServiceControlError &err) noexcept {
  return err.cause.empty()
             ? fmt::format("service control {}", kind_name(err.kind))
             : fmt::format("service control {} ({})", kind_name(err.kind), err.cause);
}

string describe(const Error &err) noexcept {
  return std::visit([](const auto &e) { return describe(e); }, err);
}

} // namespace beacon

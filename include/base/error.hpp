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

#include "base/types.hpp"

#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <cstdint>
#include <variant>

namespace beacon {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

/// @brief Result of a fallible operation, either a value or a domain error.
///        Accessing the wrong side throws bad_result_access.
template <typename T, typename E> using result = outcome::checked<T, E>;

struct ConfigError {
  enum Kind : uint8_t { NotFound = 0, Malformed, Invalid };

  Kind kind;
  string field; // populated for Invalid
  string detail;

  bool operator==(const ConfigError &) const = default;
};

struct AdapterError {
  enum Kind : uint8_t { NoSuitableAdapter = 0, InvalidOverride };

  Kind kind;
  string detail;

  bool operator==(const AdapterError &) const = default;
};

struct RegistrationError {
  enum Kind : uint8_t { TxtTooLarge = 0, AlreadyRegistered, Backend };

  Kind kind;
  string cause;

  bool operator==(const RegistrationError &) const = default;
};

struct ServiceControlError {
  enum Kind : uint8_t { PermissionDenied = 0, AlreadyInstalled, NotInstalled, Backend };

  Kind kind;
  string cause;

  bool operator==(const ServiceControlError &) const = default;
};

/// @brief Errors of every failure domain, composed at the orchestration boundary
using Error = std::variant<ConfigError, AdapterError, RegistrationError, ServiceControlError>;

/// @brief Process exit codes, stable across releases
struct exit_code {
  static constexpr int ok{0};
  static constexpr int usage{1};
  static constexpr int config{2};
  static constexpr int adapter{3};
  static constexpr int registration{4};
  static constexpr int service_control{5};
};

int exit_code_for(const Error &err) noexcept;

csv kind_name(ConfigError::Kind kind) noexcept;
csv kind_name(AdapterError::Kind kind) noexcept;
csv kind_name(RegistrationError::Kind kind) noexcept;
csv kind_name(ServiceControlError::Kind kind) noexcept;

string describe(const ConfigError &err) noexcept;
string describe(const AdapterError &err) noexcept;
string describe(const RegistrationError &err) noexcept;
string describe(const ServiceControlError &err) noexcept;
string describe(const Error &err) noexcept;

} // namespace beacon

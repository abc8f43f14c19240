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

#include "base/asio.hpp"
#include "base/error.hpp"
#include "base/types.hpp"
#include "conf/service_config.hpp"
#include "mdns/backend.hpp"

#include <memory>
#include <optional>

namespace beacon {
namespace mdns {

/// @brief Builds the SMB advertisement from a ServiceConfig and owns the
///        single live registration.  Not thread safe, one owner at a time.
class Registrar {
public:
  explicit Registrar(std::shared_ptr<Backend> backend) noexcept : backend(std::move(backend)) {}

  /// @brief TXT entries in publish order
  static TxtEntries make_txt(const conf::ServiceConfig &cfg) noexcept;

  /// @brief TxtTooLarge when a single entry or the encoded total is over the limit
  static result<void, RegistrationError> check_txt(const TxtEntries &txt) noexcept;

  static Advert make_advert(const conf::ServiceConfig &cfg, const IpAddrV4 &bind_ip) noexcept;

  /// @brief Publish the advertisement for cfg on bind_ip
  /// @return handle or RegistrationError (TxtTooLarge, AlreadyRegistered, Backend)
  result<Handle, RegistrationError> register_service(const conf::ServiceConfig &cfg,
                                                     const IpAddrV4 &bind_ip) noexcept;

  /// @brief Withdraw the advertisement, a released or unknown handle is a no-op.
  ///        The handle is released even when the backend reports an error.
  result<void, RegistrationError> unregister(Handle handle) noexcept;

  /// @brief Drop the live handle without contacting the backend
  /// @return true when handle was the live handle
  bool release(Handle handle) noexcept;

  /// @brief Backend withdraw with failures wrapped as Backend(cause).
  ///        Logs nothing, safe to call from a thread that may outlive the logger.
  static result<void, RegistrationError> withdraw(Backend &backend, Handle handle) noexcept;

  const std::optional<Handle> &handle() const noexcept { return live; }

private:
  // order dependent
  std::shared_ptr<Backend> backend;

  // order independent
  std::optional<Handle> live;

public:
  static constexpr size_t max_txt_entry{255};
  static constexpr size_t max_txt_total{1300};

public:
  MOD_ID("mdns.reg");
};

} // namespace mdns
} // namespace beacon

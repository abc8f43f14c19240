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
#include "net/adapter.hpp"

#include <array>
#include <optional>

namespace beacon {
namespace net {

/// @brief Name fragments (compared case-insensitive) that mark an adapter
///        as virtual, tunnel or VPN
inline constexpr std::array virtual_name_hints{
    "virtual"sv, "vpn"sv,  "hyper-v"sv, "bluetooth"sv, "tun"sv,       "tap"sv,      "docker"sv,
    "veth"sv,    "virbr"sv, "vmnet"sv,  "vbox"sv,      "wg"sv,        "tailscale"sv, "zerotier"sv,
    "loopback"sv};

/// @brief 10.0.0.0/8, 172.16.0.0/12 or 192.168.0.0/16
bool is_private(const IpAddrV4 &addr) noexcept;

/// @brief First private address of the adapter, if any
std::optional<IpAddrV4> first_private(const NetworkAdapter &adapter) noexcept;

/// @brief Virtual when the OS says so, the name carries a virtual hint or
///        the adapter has no private IPv4 address
bool classify_virtual(const NetworkAdapter &adapter) noexcept;

/// @brief Choose the address to advertise.
///
///        A configured bind_address always wins and the adapter list is not
///        consulted.  Otherwise the first adapter (enumeration order) that is
///        up, not virtual and carries a private IPv4 address supplies its
///        first private address.
///
/// @param cfg validated service configuration
/// @param adapters snapshot from an AdapterSource
/// @return selected address or AdapterError
result<IpAddrV4, AdapterError> select_bind_address(const conf::ServiceConfig &cfg,
                                                   const Adapters &adapters) noexcept;

} // namespace net
} // namespace beacon

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
#include "base/types.hpp"

#include <vector>

namespace beacon {
namespace net {

using IpAddrs = std::vector<IpAddrV4>;

/// @brief Snapshot of a single host network interface
struct NetworkAdapter {
  string name;
  IpAddrs addrs;         // IPv4 only, in the order the OS reported them
  bool is_virtual{false}; // OS hint (loopback, point to point, /sys/devices/virtual)
  bool is_up{false};

  bool operator==(const NetworkAdapter &) const = default;
};

using Adapters = std::vector<NetworkAdapter>;

/// @brief Network enumeration seam, the real implementation reads getifaddrs()
class AdapterSource {
public:
  virtual ~AdapterSource() noexcept = default;

  /// @brief Current adapters in enumeration order
  virtual Adapters snapshot() = 0;
};

class SystemAdapters : public AdapterSource {
public:
  SystemAdapters() = default;

  Adapters snapshot() override;

public:
  MOD_ID("net.adapters");
};

} // namespace net
} // namespace beacon

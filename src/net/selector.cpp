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

#include "net/selector.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

namespace beacon {
namespace net {

bool is_private(const IpAddrV4 &addr) noexcept {
  const auto bytes = addr.to_bytes();

  switch (bytes[0]) {
  case 10:
    return true;
  case 172:
    return (bytes[1] >= 16) && (bytes[1] <= 31);
  case 192:
    return bytes[1] == 168;
  default:
    return false;
  }
}

std::optional<IpAddrV4> first_private(const NetworkAdapter &adapter) noexcept {
  auto it = std::find_if(adapter.addrs.begin(), adapter.addrs.end(), is_private);

  return (it != adapter.addrs.end()) ? std::make_optional(*it) : std::nullopt;
}

bool classify_virtual(const NetworkAdapter &adapter) noexcept {
  if (adapter.is_virtual) return true;

  const auto name_hint = std::any_of(
      virtual_name_hints.begin(), virtual_name_hints.end(),
      [&name = adapter.name](csv hint) { return boost::algorithm::icontains(name, hint); });

  return name_hint || !first_private(adapter).has_value();
}

result<IpAddrV4, AdapterError> select_bind_address(const conf::ServiceConfig &cfg,
                                                   const Adapters &adapters) noexcept {

  // manual override always wins, adapters are not consulted
  if (cfg.bind_address.has_value()) {
    error_code ec;
    auto addr = asio::ip::make_address_v4(*cfg.bind_address, ec);

    if (ec) {
      return outcome::failure(AdapterError{
          AdapterError::InvalidOverride,
          fmt::format("bind_address '{}' {}", *cfg.bind_address, ec.message())});
    }

    return outcome::success(addr);
  }

  for (const auto &adapter : adapters) {
    if (!adapter.is_up || classify_virtual(adapter)) continue;

    // classify_virtual() guarantees a private address exists
    return outcome::success(*first_private(adapter));
  }

  return outcome::failure(AdapterError{AdapterError::NoSuitableAdapter,
                                       fmt::format("none of {} adapters qualify", adapters.size())});
}

} // namespace net
} // namespace beacon

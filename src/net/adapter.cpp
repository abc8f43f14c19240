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

#include "net/adapter.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace beacon {
namespace net {

namespace fs = std::filesystem;

Adapters SystemAdapters::snapshot() {
  INFO_AUTO_CAT("snapshot");

  Adapters adapters;
  struct ifaddrs *addrs;

  if (getifaddrs(&addrs) < 0) {
    INFO_AUTO("getifaddrs() failed, reason={}", std::strerror(errno));
    return adapters;
  }

  // getifaddrs() yields one entry per (interface, address family), fold
  // them into a single adapter per name keeping first seen order
  for (auto iap = addrs; iap != nullptr; iap = iap->ifa_next) {
    const csv name{iap->ifa_name};

    auto it = std::find_if(adapters.begin(), adapters.end(),
                           [&name](const auto &a) { return a.name == name; });

    if (it == adapters.end()) {
      std::error_code ec;
      const auto sys_virtual = fs::exists(fs::path("/sys/devices/virtual/net") / name, ec);

      it = adapters.insert(adapters.end(),
                           NetworkAdapter{.name = string(name),
                                          .addrs = {},
                                          .is_virtual = sys_virtual ||
                                                        (iap->ifa_flags & IFF_LOOPBACK) ||
                                                        (iap->ifa_flags & IFF_POINTOPOINT),
                                          .is_up = (iap->ifa_flags & IFF_UP) != 0});
    }

    // IPv6 is not advertised
    if (iap->ifa_addr && (iap->ifa_addr->sa_family == AF_INET)) {
      auto *sin = reinterpret_cast<struct sockaddr_in *>(iap->ifa_addr);

      it->addrs.emplace_back(IpAddrV4(ntohl(sin->sin_addr.s_addr)));
    }
  }

  freeifaddrs(addrs);

  for (const auto &a : adapters) {
    INFO("debug", "{:<12} up={} virtual={} ipv4={}", a.name, a.is_up, a.is_virtual,
         a.addrs.size());
  }

  return adapters;
}

} // namespace net
} // namespace beacon

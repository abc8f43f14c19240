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
#include "base/dura_t.hpp"
#include "base/error.hpp"
#include "base/types.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace beacon {
namespace mdns {

using TxtEntries = std::vector<string>;

/// @brief Opaque token for one published advertisement
struct Handle {
  uint64_t id{0};

  bool operator==(const Handle &) const = default;
  auto operator<=>(const Handle &) const = default;
};

/// @brief Everything a backend needs to publish a single DNS-SD service
struct Advert {
  string service_type;  // fully qualified, e.g. _smb._tcp.local.
  string instance_name; // e.g. Samba-Share
  string host_fqdn;     // e.g. pc.local.
  Port port{0};
  IpAddrV4 bind_ip;
  TxtEntries txt; // key=value, in publish order

  bool operator==(const Advert &) const = default;
};

/// @brief A resolved service discovered by browse()
struct Found {
  string name;
  string type;
  string domain;
  string hostname;
  string address;
  Port port{0};
  string protocol;
  TxtEntries txt;

  string inspect() const noexcept;
};

using FoundList = std::vector<Found>;

/// @brief mDNS / DNS-SD responder seam
class Backend {
public:
  using FaultHandler = std::function<void(const string &cause)>;

public:
  virtual ~Backend() noexcept = default;

  /// @brief Publish the advertisement
  /// @return handle to pass to withdraw() or RegistrationError
  virtual result<Handle, RegistrationError> publish(const Advert &advert) noexcept = 0;

  /// @brief Remove a published advertisement, unknown handles are ignored
  virtual result<void, RegistrationError> withdraw(Handle handle) noexcept = 0;

  /// @brief Collect resolved services of stype for the duration
  virtual FoundList browse(csv stype, Seconds duration) noexcept = 0;

  /// @brief Install the handler invoked when a published advertisement is
  ///        lost after publish() returned (collision, responder failure).
  ///        The handler may be called from a backend thread.
  virtual void on_fault(FaultHandler handler) noexcept = 0;
};

} // namespace mdns
} // namespace beacon

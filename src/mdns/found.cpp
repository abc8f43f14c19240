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

#include "mdns/backend.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <iterator>

namespace beacon {
namespace mdns {

string Found::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "{} '{}' {} {} {}:{} TXT: ", type, name, hostname, protocol, address, port);

  std::for_each(txt.begin(), txt.end(), [&w](const string &entry) {
    fmt::format_to(w, "{} ", entry);
  });

  return msg;
}

} // namespace mdns
} // namespace beacon

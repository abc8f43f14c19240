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

#include <array>
#include <fmt/format.h>
#include <pthread.h>

namespace beacon {

inline void name_thread(csv name) noexcept {
  static constexpr csv prefix{"bcn"};
  const auto tid = pthread_self();

  // linux limits thread names to 15 chars + null
  auto thread_name = fmt::format("{}_{}", prefix, name);
  if (thread_name.size() > 15) thread_name.resize(15);

  std::array<char, 64> buff{0x00};
  pthread_getname_np(tid, buff.data(), buff.size());

  if (csv(buff.data()) != csv(thread_name)) {
    pthread_setname_np(tid, thread_name.c_str());
  }
}

} // namespace beacon

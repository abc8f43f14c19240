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

#include <chrono>
#include <concepts>

namespace beacon {

using namespace std::chrono_literals;

using Nanos = std::chrono::nanoseconds;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

using millis_fp = std::chrono::duration<double, std::chrono::milliseconds::period>;

using steady_clock = std::chrono::steady_clock;

template <typename T>
concept IsDuration = IsAnyOf<std::remove_cvref_t<T>, Nanos, Millis, Seconds, millis_fp>;

} // namespace beacon

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

#include "base/dura_t.hpp"

#include <cstdint>
#include <type_traits>

namespace beacon {

class Elapsed {
public:
  Elapsed(void) noexcept : nanos(monotonic()) {}

  /// @brief return the elapsed duration as an explicit type
  /// @tparam TO requested return type
  /// @return elapsed duration as requested type
  template <typename TO> inline TO as() const noexcept {
    if constexpr (std::same_as<TO, Nanos>) {
      return elapsed();
    } else if constexpr (IsDuration<TO>) {
      return std::chrono::duration_cast<TO>(elapsed());
    } else if constexpr (std::signed_integral<TO>) {
      return elapsed().count();
    } else {
      static_assert(AlwaysFalse<TO>, "unsupported type");
      return 0;
    }
  }

  /// @brief Create a humanized (e.g. 1m 20s) of the elapsed duration
  /// @return const string
  const string humanize() const noexcept { return humanize(elapsed()); }

  /// @brief Humanize an arbitrary duration (e.g. 500ms, 12.34s, 1m 20s)
  static string humanize(Nanos d) noexcept;

private:
  static Nanos monotonic() noexcept;
  Nanos elapsed() const noexcept { return monotonic() - nanos; }

private:
  const Nanos nanos;
};

} // namespace beacon

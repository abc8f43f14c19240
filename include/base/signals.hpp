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

#include <boost/asio/signal_set.hpp>
#include <functional>
#include <thread>

namespace beacon {

/// @brief Watches SIGINT and SIGTERM on a dedicated io_context thread and
///        invokes the handler (from that thread) for each signal caught.
///        Stops watching when destroyed.
class SignalWatch {
public:
  using Handler = std::function<void(int signal)>;

public:
  explicit SignalWatch(Handler handler) noexcept;
  ~SignalWatch() noexcept;

  SignalWatch(const SignalWatch &) = delete;
  SignalWatch(SignalWatch &&) = delete;

private:
  void async_signal() noexcept;

private:
  // order dependent
  asio::io_context io_ctx;
  asio::signal_set ss_shutdown;
  Handler handler;

  // order independent
  std::jthread thread;

public:
  MOD_ID("signals");
};

} // namespace beacon

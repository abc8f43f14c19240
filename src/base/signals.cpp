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

#include "base/signals.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"

#include <csignal>

namespace beacon {

SignalWatch::SignalWatch(Handler handler) noexcept
    : ss_shutdown(io_ctx, SIGINT, SIGTERM), //
      handler(std::move(handler))           //
{
  async_signal();

  thread = std::jthread([this]() {
    name_thread("signals");

    io_ctx.run();
  });
}

SignalWatch::~SignalWatch() noexcept {
  io_ctx.stop();

  if (thread.joinable()) thread.join();
}

void SignalWatch::async_signal() noexcept {

  ss_shutdown.async_wait([this](const error_code &ec, int sig) {
    INFO_AUTO_CAT("caught");

    if (ec) return;

    INFO_AUTO("{}({})", sig == SIGTERM ? "SIGTERM" : "SIGINT", sig);

    handler(sig);

    // a second signal is passed along as well, the handler decides
    async_signal();
  });
}

} // namespace beacon

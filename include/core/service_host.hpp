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
#include "conf/service_config.hpp"
#include "core/shutdown.hpp"
#include "mdns/backend.hpp"
#include "mdns/registrar.hpp"
#include "net/adapter.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace beacon {
namespace core {

/// @brief Drives a single advertisement through its lifecycle:
///        Stopped -> Starting -> Running -> StopPending -> Stopped
///
///        run() (or on_start()) executes on the calling thread and returns the
///        process exit code.  on_stop() may be called from any thread.  A host
///        is single use, the shutdown signal is one shot.
class ServiceHost {
public:
  enum State : uint8_t { Stopped = 0, Starting, Running, StopPending };

  using StateObserver = std::function<void(State)>;

  struct Opts {
    std::filesystem::path cfg_file;
    Millis grace{5000};
    Millis tick{250};
    std::optional<conf::ServiceConfig> cfg{}; // used as is, cfg_file is not read
  };

public:
  ServiceHost(Opts opts, std::shared_ptr<mdns::Backend> backend,
              std::shared_ptr<net::AdapterSource> adapters) noexcept;
  ~ServiceHost() noexcept;

  ServiceHost(const ServiceHost &) = delete;
  ServiceHost(ServiceHost &&) = delete;

  /// @brief Foreground run, returns when shutdown completes
  /// @return process exit code
  int run() noexcept;

  /// @brief Service manager start event, same sequence as run()
  int on_start() noexcept { return run(); }

  /// @brief Service manager stop event (or signal), requests shutdown
  void on_stop() noexcept;

  /// @brief Install a state change observer, call before run()
  void observe(StateObserver observer) noexcept { state_observer = std::move(observer); }

  State state() const noexcept { return _state.load(); }

  /// @brief The error that determined a non-zero exit code
  const std::optional<Error> &last_error() const noexcept { return _last_error; }

  /// @brief Address chosen at startup
  const std::optional<IpAddrV4> &bind_address() const noexcept { return bind_ip; }

  ShutdownCoordinator &shutdown() noexcept { return coordinator; }

private:
  void fail(Error err) noexcept;
  void handle_fault() noexcept;
  void set_state(State next) noexcept;
  bool start() noexcept;
  void stop() noexcept;

private:
  // order dependent
  const Opts opts;
  std::shared_ptr<mdns::Backend> backend;
  std::shared_ptr<net::AdapterSource> adapters;
  std::shared_ptr<mdns::Registrar> registrar;

  // order independent
  ShutdownCoordinator coordinator;
  std::atomic<State> _state{Stopped};
  StateObserver state_observer;
  std::optional<conf::ServiceConfig> cfg;
  std::optional<IpAddrV4> bind_ip;
  std::optional<Error> _last_error;
  int exit_rc{exit_code::ok};

  std::atomic_bool fault_pending{false};
  std::mutex fault_mtx;
  string fault_cause;

public:
  MOD_ID("core.host");
};

csv state_name(ServiceHost::State state) noexcept;

} // namespace core
} // namespace beacon

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

#include "core/service_host.hpp"
#include "base/elapsed.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "net/selector.hpp"

#include <fmt/std.h>
#include <future>
#include <thread>

namespace beacon {
namespace core {

ServiceHost::ServiceHost(Opts opts, std::shared_ptr<mdns::Backend> backend,
                         std::shared_ptr<net::AdapterSource> adapters) noexcept
    : opts(std::move(opts)),                                     //
      backend(std::move(backend)),                               //
      adapters(std::move(adapters)),                             //
      registrar(std::make_shared<mdns::Registrar>(this->backend)) //
{
  // faults arrive on a backend thread, the run loop picks them up at the next tick
  this->backend->on_fault([this](const string &cause) {
    std::unique_lock lck(fault_mtx);

    fault_cause = cause;
    fault_pending = true;
  });
}

ServiceHost::~ServiceHost() noexcept { backend->on_fault(nullptr); }

void ServiceHost::fail(Error err) noexcept {
  INFO_AUTO_CAT("fail");

  INFO_AUTO("{}", describe(err));

  exit_rc = exit_code_for(err);
  _last_error.emplace(std::move(err));
}

void ServiceHost::handle_fault() noexcept {
  INFO_AUTO_CAT("fault");

  string cause;
  {
    std::unique_lock lck(fault_mtx);
    cause = std::move(fault_cause);
  }

  INFO_AUTO("backend fault, {}", cause);

  if (auto stale = registrar->handle(); stale.has_value()) {
    if (auto rc = registrar->unregister(*stale); !rc) {
      INFO_AUTO("WARN stale handle unregister failed, {}", describe(rc.error()));
    }
  }

  // exactly one attempt per fault, no retry loop
  if (auto rc = registrar->register_service(*cfg, *bind_ip); !rc) {
    fail(rc.error());
    coordinator.request_shutdown();
  } else {
    INFO_AUTO("re-registered handle={}", rc.value().id);
  }
}

void ServiceHost::on_stop() noexcept {
  INFO_AUTO_CAT("on_stop");

  if (coordinator.request_shutdown()) INFO_AUTO("stop requested, state={}", state_name(state()));
}

int ServiceHost::run() noexcept {
  INFO_AUTO_CAT("run");

  set_state(Starting);

  if (start()) {
    Elapsed advertised;
    set_state(Running);

    while (coordinator.wait_for_shutdown(opts.tick) == ShutdownCoordinator::Wait::Timeout) {
      if (fault_pending.exchange(false)) handle_fault();
    }

    INFO_AUTO("advertised for {}", advertised.humanize());

    set_state(StopPending);
    stop();
  }

  coordinator.mark_stopped();
  set_state(Stopped);

  INFO_AUTO("finished, exit_code={}", exit_rc);

  return exit_rc;
}

void ServiceHost::set_state(State next) noexcept {
  INFO_AUTO_CAT("state");

  const auto prev = _state.exchange(next);

  INFO_AUTO("{} -> {}", state_name(prev), state_name(next));

  if (state_observer) state_observer(next);
}

bool ServiceHost::start() noexcept {
  INFO_AUTO_CAT("start");

  if (opts.cfg.has_value()) {
    auto checked = conf::ServiceConfig::validated(*opts.cfg);
    if (!checked) {
      fail(checked.error());
      return false;
    }

    cfg.emplace(std::move(checked).value());
  } else {
    auto loaded = conf::ServiceConfig::load(opts.cfg_file);
    if (!loaded) {
      fail(loaded.error());
      return false;
    }

    INFO_AUTO("loaded {}", opts.cfg_file);
    cfg.emplace(std::move(loaded).value());
  }

  // the adapter source is only consulted without an override
  auto selected = cfg->bind_address.has_value()
                      ? net::select_bind_address(*cfg, net::Adapters())
                      : net::select_bind_address(*cfg, adapters->snapshot());

  if (!selected) {
    fail(selected.error());
    return false;
  }

  bind_ip.emplace(selected.value());
  INFO_AUTO("bind_address={}{}", bind_ip->to_string(),
            cfg->bind_address.has_value() ? " (override)" : "");

  if (auto registered = registrar->register_service(*cfg, *bind_ip); !registered) {
    fail(registered.error());
    return false;
  }

  return true;
}

void ServiceHost::stop() noexcept {
  INFO_AUTO_CAT("stop");

  const auto handle = registrar->handle();
  if (!handle.has_value() || !registrar->release(*handle)) return;

  using unreg_result = result<void, RegistrationError>;

  auto prom = std::make_shared<std::promise<unreg_result>>();
  auto fut = prom->get_future();

  // the helper may outlive this host (and the logger) after the grace
  // period so it owns what it touches and reports only through the promise
  std::thread([backend = backend, handle = *handle, prom = prom]() {
    name_thread("unregister");

    prom->set_value(mdns::Registrar::withdraw(*backend, handle));
  }).detach();

  if (fut.wait_for(opts.grace) != std::future_status::ready) {
    INFO_AUTO("WARN unregister did not finish within {}, continuing", opts.grace);
  } else if (auto rc = fut.get(); !rc) {
    INFO_AUTO("WARN unregister failed, {}", describe(rc.error()));
  } else {
    INFO_AUTO("unregistered handle={}", handle->id);
  }
}

csv state_name(ServiceHost::State state) noexcept {
  switch (state) {
  case ServiceHost::Stopped:
    return "stopped";
  case ServiceHost::Starting:
    return "starting";
  case ServiceHost::Running:
    return "running";
  case ServiceHost::StopPending:
    return "stop_pending";
  }

  return "unknown";
}

} // namespace core
} // namespace beacon

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

#include "mdns/avahi.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"
#include "net/adapter.hpp"

#include <algorithm>
#include <array>
#include <avahi-common/address.h>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <net/if.h>
#include <thread>
#include <vector>

namespace beacon {
namespace mdns {

AvahiBackend::AvahiBackend() noexcept {
  INFO_AUTO_CAT("init");

  tpoll = avahi_threaded_poll_new();

  if (tpoll == nullptr) {
    err_msg.assign("failed to allocate threaded_poll");
    INFO_AUTO("{}", err_msg);
    return;
  }

  auto poll = avahi_threaded_poll_get(tpoll);
  int err{0};

  // notes:
  //  1. the client pointer is captured by cb_client(), the callback fires
  //     before avahi_client_new() returns
  //  2. AVAHI_CLIENT_NO_FAIL creates the client even when the daemon is not
  //     (yet) available and reconnects when it appears
  const AvahiClientFlags flags = AVAHI_CLIENT_NO_FAIL;
  auto new_client = avahi_client_new(poll, flags, AvahiBackend::cb_client, this, &err);

  if (new_client == nullptr) {
    err_msg = fmt::format("failed to allocate client: {}", avahi_strerror(err));
    INFO_AUTO("{}", err_msg);
    return;
  }

  client = new_client;

  if (err = avahi_threaded_poll_start(tpoll); err < 0) {
    err_msg.assign(avahi_strerror(err));
    INFO_AUTO("threaded poll start failed, reason={}", err_msg);
  }
}

AvahiBackend::~AvahiBackend() noexcept {

  if (tpoll != nullptr) {
    if (client != nullptr) {
      lock();
      for (auto &[handle, group] : groups) {
        avahi_entry_group_reset(group);
        avahi_entry_group_free(group);
      }

      groups.clear();
      unlock();
    }

    avahi_threaded_poll_stop(tpoll);
  }

  if (client != nullptr) avahi_client_free(client);
  if (tpoll != nullptr) avahi_threaded_poll_free(tpoll);
}

string AvahiBackend::bare_type(csv stype) noexcept {
  string bare(stype);

  if (!bare.empty() && (bare.back() == '.')) bare.pop_back();

  if (boost::algorithm::iends_with(bare, ".local")) bare.resize(bare.size() - ".local"sv.size());

  return bare;
}

bool AvahiBackend::client_ready() noexcept {
  INFO_AUTO_CAT("client");

  if (!err_msg.empty()) return false;

  // the daemon may have dropped out since the first connect
  if (!link.wait_running(client_wait)) {
    INFO_AUTO("client not running after {}, state={}", client_wait, phase_name(link.current()));
    return false;
  }

  return true;
}

void AvahiBackend::fault(const string &cause) noexcept {
  INFO_AUTO_CAT("fault");

  std::unique_lock lck(fault_mtx);

  INFO_AUTO("{}", cause);

  if (fault_handler) fault_handler(cause);
}

AvahiIfIndex AvahiBackend::iface_for(const IpAddrV4 &addr) noexcept {
  net::SystemAdapters system;

  for (const auto &adapter : system.snapshot()) {
    if (std::find(adapter.addrs.begin(), adapter.addrs.end(), addr) != adapter.addrs.end()) {
      if (const auto idx = if_nametoindex(adapter.name.c_str()); idx > 0) {
        return static_cast<AvahiIfIndex>(idx);
      }
    }
  }

  return AVAHI_IF_UNSPEC;
}

void AvahiBackend::on_fault(FaultHandler handler) noexcept {
  std::unique_lock lck(fault_mtx);

  fault_handler = std::move(handler);
}

result<Handle, RegistrationError> AvahiBackend::publish(const Advert &advert) noexcept {
  INFO_AUTO_CAT("publish");

  if (!client_ready()) {
    return outcome::failure(RegistrationError{
        RegistrationError::Backend,
        err_msg.empty() ? string("avahi client is not running") : err_msg});
  }

  const auto iface = iface_for(advert.bind_ip);
  const auto stype = bare_type(advert.service_type);

  // avahi wants the host without the trailing dot
  string host(advert.host_fqdn);
  if (!host.empty() && (host.back() == '.')) host.pop_back();

  std::vector<ccs> ccs_ptrs;
  for (const auto &entry : advert.txt) {
    ccs_ptrs.emplace_back(entry.c_str()); // advert must remain in scope
  }

  std::unique_lock lck(*this);

  auto group = avahi_entry_group_new(client, cb_entry_group, this);
  if (group == nullptr) {
    return outcome::failure(RegistrationError{RegistrationError::Backend,
                                              fmt::format("entry group: {}", error_string(client))});
  }

  // the host name is only ours to publish when it is not the avahi host
  const csv avahi_host{avahi_client_get_host_name_fqdn(client)};
  const auto own_host = boost::algorithm::iequals(avahi_host, host);

  auto failed = [&](csv what, int rc) {
    avahi_entry_group_free(group);

    return outcome::failure(
        RegistrationError{RegistrationError::Backend, fmt::format("{}: {}", what, avahi_strerror(rc))});
  };

  if (!own_host) {
    AvahiAddress addr;

    if (avahi_address_parse(advert.bind_ip.to_string().c_str(), AVAHI_PROTO_INET, &addr) ==
        nullptr) {
      return failed("address parse", AVAHI_ERR_INVALID_ADDRESS);
    }

    constexpr auto flags = AVAHI_PUBLISH_NO_REVERSE;
    if (auto rc = avahi_entry_group_add_address(group, iface, AVAHI_PROTO_INET, flags, host.c_str(),
                                                &addr);
        rc != AVAHI_OK) {
      return failed(fmt::format("address {}", host), rc);
    }
  }

  constexpr AvahiPublishFlags flags = static_cast<AvahiPublishFlags>(0);

  auto sl = avahi_string_list_new_from_array(ccs_ptrs.data(), static_cast<int>(ccs_ptrs.size()));
  auto rc = avahi_entry_group_add_service_strlst(group,                      // group
                                                 iface,                      // network interface
                                                 AVAHI_PROTO_INET,           // IPv4 only
                                                 flags,                      // publish flags
                                                 advert.instance_name.c_str(), // instance
                                                 stype.c_str(),              // service type
                                                 domain.data(),              // domain
                                                 own_host ? nullptr : host.c_str(), // target host
                                                 advert.port,                // port
                                                 sl);                        // txt
  avahi_string_list_free(sl); // avahi copied it

  if (rc == AVAHI_ERR_COLLISION) {
    return failed(fmt::format("name '{}' in use", advert.instance_name), rc);
  } else if (rc != AVAHI_OK) {
    return failed("add service", rc);
  }

  if (rc = avahi_entry_group_commit(group); rc != AVAHI_OK) return failed("commit", rc);

  Handle handle{next_id++};
  groups.emplace(handle, group);

  INFO_AUTO("{} '{}' host={}{} iface={} handle={}", stype, advert.instance_name, host,
            own_host ? " (avahi host)" : "", iface, handle.id);

  return outcome::success(handle);
}

result<void, RegistrationError> AvahiBackend::withdraw(Handle handle) noexcept {
  INFO_AUTO_CAT("withdraw");

  if (tpoll == nullptr) return outcome::success();

  std::unique_lock lck(*this);

  auto it = groups.find(handle);
  if (it == groups.end()) return outcome::success();

  auto group = it->second;
  groups.erase(it);

  const auto rc = avahi_entry_group_reset(group);
  avahi_entry_group_free(group);

  if (rc != AVAHI_OK) {
    return outcome::failure(RegistrationError{RegistrationError::Backend,
                                              fmt::format("reset: {}", avahi_strerror(rc))});
  }

  INFO_AUTO("handle={}", handle.id);

  return outcome::success();
}

FoundList AvahiBackend::browse(csv stype, Seconds duration) noexcept {
  INFO_AUTO_CAT("browse");

  if (!client_ready()) {
    INFO_AUTO("client not ready, {}", err_msg);
    return FoundList();
  }

  Browse ctx{.backend = this, .resolvers = {}, .found = {}};
  const auto bare = bare_type(stype);

  lock();
  auto sb = avahi_service_browser_new(client,              // client
                                      AVAHI_IF_UNSPEC,     // network interface
                                      AVAHI_PROTO_INET,    // IPv4 only
                                      bare.c_str(),        // service type
                                      domain.data(),       // domain
                                      (AvahiLookupFlags)0, // lookup flags
                                      AvahiBackend::cb_browse, // callback
                                      &ctx);               // userdata
  unlock();

  if (sb == nullptr) {
    INFO_AUTO("create failed {} reason={}", bare, error_string(client));
    return FoundList();
  }

  INFO_AUTO("browsing {} for {}", bare, duration);
  std::this_thread::sleep_for(duration);

  lock();
  avahi_service_browser_free(sb);

  // resolvers still in flight reference ctx
  for (auto r : ctx.resolvers) {
    avahi_service_resolver_free(r);
  }

  auto found = std::move(ctx.found);
  unlock();

  return found;
}

void AvahiBackend::cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                             AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                             AvahiLookupResultFlags, void *user_data) { // static
  INFO_AUTO_CAT("cb_browse");

  auto ctx = static_cast<Browse *>(user_data);
  auto self = ctx->backend;

  switch (event) {
  case AVAHI_BROWSER_FAILURE: {
    INFO_AUTO("browser={} error={}", fmt::ptr(b), error_string(b));
  } break;

  case AVAHI_BROWSER_NEW: {
    INFO("debug", "NEW {} {}", type, name);

    AvahiLookupFlags flags{};

    auto r = avahi_service_resolver_new(self->client,     // the client
                                        iface,            // same interface
                                        protocol,         // same protocol
                                        name,             // same service name
                                        type,             // same service type
                                        domain,           // same domain
                                        AVAHI_PROTO_INET, // resolve IPv4
                                        flags,            // resolve flags
                                        cb_resolve,       // callback when resolved
                                        ctx);             // same userdata

    if (r) {
      ctx->resolvers.insert(r);
    } else {
      INFO_AUTO("RESOLVER failed, service={} reason={}", name, error_string(self->client));
    }
  } break;

  case AVAHI_BROWSER_REMOVE: {
    INFO("debug", "REMOVE {} {} {}", name, type, domain);

    std::erase_if(ctx->found, [name = csv(name)](const auto &f) { return f.name == name; });
  } break;

  case AVAHI_BROWSER_ALL_FOR_NOW:
  case AVAHI_BROWSER_CACHE_EXHAUSTED: {
    INFO("debug", "{}", event == AVAHI_BROWSER_ALL_FOR_NOW ? "ALL_FOR_NOW" : "CACHE_EXHAUSTED");
  } break;
  }
}

void AvahiBackend::cb_client(AvahiClient *client, AvahiClientState state, void *user_data) {
  INFO_AUTO_CAT("cb_client");

  auto self = static_cast<AvahiBackend *>(user_data);

  // first invocation happens inside avahi_client_new()
  if (self->client == nullptr) self->client = client;

  const auto published = !self->groups.empty();

  switch (state) {
  case AVAHI_CLIENT_CONNECTING: {
    INFO_AUTO("CONNECTING, client={}", fmt::ptr(client));

    // daemon went away, published groups are gone with it
    self->link.enter(LinkState::Connecting, published);
  } break;

  case AVAHI_CLIENT_S_REGISTERING: {
    INFO_AUTO("REGISTERING, client={}", fmt::ptr(client));

    // server is re-registering its host records, our groups were dropped
    self->link.enter(LinkState::Registering, published);
  } break;

  case AVAHI_CLIENT_S_RUNNING: {
    name_thread("mdns");

    INFO_AUTO("RUNNING, vsn='{}' host={}", avahi_client_get_version_string(client),
              avahi_client_get_host_name_fqdn(client));

    // lost records are reported now, a re-publish from the fault handler can succeed
    if (auto cause = self->link.enter(LinkState::Running, published); cause.has_value()) {
      self->fault(*cause);
    }
  } break;

  case AVAHI_CLIENT_FAILURE: {
    INFO_AUTO("FAILED, reason={}", error_string(client));

    self->link.enter(LinkState::Failed, published);
    self->fault(fmt::format("avahi client failure: {}", error_string(client)));
  } break;

  case AVAHI_CLIENT_S_COLLISION: {
    INFO_AUTO("NAME COLLISION, reason={}", error_string(client));

    // groups are reset while the server picks a new host name
    self->link.enter(LinkState::Registering, published);
  } break;
  }
}

void AvahiBackend::cb_entry_group(AvahiEntryGroup *group, AvahiEntryGroupState state,
                                  void *user_data) {
  INFO_AUTO_CAT("cb_evt_grp");

  auto self = static_cast<AvahiBackend *>(user_data);

  // groups only holds committed groups, anything else belongs to publish()
  auto it = std::find_if(self->groups.begin(), self->groups.end(),
                         [group](const auto &kv) { return kv.second == group; });
  const auto id = (it != self->groups.end()) ? it->first.id : 0;

  switch (state) {
  case AVAHI_ENTRY_GROUP_ESTABLISHED: {
    INFO_AUTO("ESTABLISHED, group={} handle={}", fmt::ptr(group), id);
  } break;

  case AVAHI_ENTRY_GROUP_COLLISION: {
    INFO_AUTO("COLLISION, group={} handle={}", fmt::ptr(group), id);
    if (id) self->fault(fmt::format("handle={} name collision", id));
  } break;

  case AVAHI_ENTRY_GROUP_FAILURE: {
    INFO_AUTO("FAILURE, group={} reason={}", fmt::ptr(group), error_string(group));
    // while the daemon is away the loss is reported on return to running
    if (id && self->link.usable()) self->fault(fmt::format("handle={} {}", id, error_string(group)));
  } break;

  case AVAHI_ENTRY_GROUP_UNCOMMITED:
  case AVAHI_ENTRY_GROUP_REGISTERING: {
    INFO("debug", "state={} group={}", static_cast<int>(state), fmt::ptr(group));
  } break;
  }
}

void AvahiBackend::cb_resolve(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol protocol,
                              AvahiResolverEvent event, ccs name, ccs type, ccs domain,
                              ccs host_name, const AvahiAddress *address, uint16_t port,
                              AvahiStringList *txt, AvahiLookupResultFlags, void *user_data) {
  INFO_AUTO_CAT("resolve");

  auto ctx = static_cast<Browse *>(user_data);

  switch (event) {
  case AVAHI_RESOLVER_FAILURE: {
    INFO_AUTO("FAILED {}, reason={}", name, error_string(ctx->backend->client));
  } break;

  case AVAHI_RESOLVER_FOUND: {
    std::array<char, AVAHI_ADDRESS_STR_MAX> addr_str{0};

    Found found{.name = name,
                .type = type,
                .domain = domain,
                .hostname = host_name,
                .address = avahi_address_snprint(addr_str.data(), addr_str.size(), address),
                .port = port,
                .protocol = avahi_proto_to_string(protocol),
                .txt = make_txt_entries(txt)};

    INFO("debug", "{}", found.inspect());

    // a service seen on several interfaces resolves once per interface
    auto known = std::any_of(ctx->found.begin(), ctx->found.end(),
                             [&found](const auto &f) { return f.name == found.name; });

    if (!known) ctx->found.emplace_back(std::move(found));
  } break;
  }

  ctx->resolvers.erase(r);
  if (r) avahi_service_resolver_free(r);
}

TxtEntries AvahiBackend::make_txt_entries(AvahiStringList *txt) noexcept { // static
  TxtEntries entries;

  // avahi prepends, the list is in reverse publish order
  for (AvahiStringList *e = txt; e != nullptr; e = avahi_string_list_get_next(e)) {
    entries.emplace_back(reinterpret_cast<ccs>(avahi_string_list_get_text(e)),
                         avahi_string_list_get_size(e));
  }

  std::reverse(entries.begin(), entries.end());

  return entries;
}

} // namespace mdns
} // namespace beacon

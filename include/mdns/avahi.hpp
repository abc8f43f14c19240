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
#include "base/types.hpp"
#include "mdns/backend.hpp"
#include "mdns/link_state.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-client/publish.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/thread-watch.h>
#include <map>
#include <mutex>
#include <set>
#include <type_traits>

namespace beacon {
namespace mdns {

/// @brief Backend publishing through the local avahi-daemon
class AvahiBackend : public Backend {
public:
  AvahiBackend() noexcept;
  ~AvahiBackend() noexcept override;

  AvahiBackend(const AvahiBackend &) = delete;
  AvahiBackend(AvahiBackend &&) = delete;

  result<Handle, RegistrationError> publish(const Advert &advert) noexcept override;
  result<void, RegistrationError> withdraw(Handle handle) noexcept override;
  FoundList browse(csv stype, Seconds duration) noexcept override;
  void on_fault(FaultHandler handler) noexcept override;

  // BasicLockable, locks the threaded poll
  void lock() noexcept { avahi_threaded_poll_lock(tpoll); }
  void unlock() noexcept { avahi_threaded_poll_unlock(tpoll); }

private:
  struct Browse {
    AvahiBackend *backend;
    std::set<AvahiServiceResolver *> resolvers;
    FoundList found;
  };

private:
  /// @brief Wait (bounded) for the client to be running now
  bool client_ready() noexcept;

  void fault(const string &cause) noexcept;

  // avahi callbacks, invoked on the threaded poll thread with the poll locked
  static void cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags flags, void *d);
  static void cb_client(AvahiClient *client, AvahiClientState state, void *d);
  static void cb_entry_group(AvahiEntryGroup *group, AvahiEntryGroupState state, void *d);
  static void cb_resolve(AvahiServiceResolver *r, AvahiIfIndex iface, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags flags, void *d);

  template <typename T> static string error_string(T t) {
    using U = std::remove_pointer_t<T>;

    if constexpr (std::is_same_v<U, AvahiClient>) {
      return string(avahi_strerror(avahi_client_errno(t)));
    } else if constexpr (std::is_same_v<U, AvahiServiceBrowser>) {
      return error_string(avahi_service_browser_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiEntryGroup>) {
      return error_string(avahi_entry_group_get_client(t));
    } else {
      static_assert(AlwaysFalse<U>, "unhandled Avahi type");
    }
  }

  static TxtEntries make_txt_entries(AvahiStringList *txt) noexcept;

  /// @brief Service type without the trailing .local. (avahi wants _smb._tcp)
  static string bare_type(csv stype) noexcept;

  /// @brief Index of the interface carrying addr, AVAHI_IF_UNSPEC when unknown
  static AvahiIfIndex iface_for(const IpAddrV4 &addr) noexcept;

private:
  // order dependent
  AvahiThreadedPoll *tpoll{nullptr};
  AvahiClient *client{nullptr};
  LinkState link;

  // order independent, guarded by the threaded poll lock
  string err_msg;
  std::map<Handle, AvahiEntryGroup *> groups;
  uint64_t next_id{1};

  // fault handler has its own lock, it is installed outside the poll
  std::mutex fault_mtx;
  FaultHandler fault_handler;

public:
  static constexpr Millis client_wait{5000};
  static constexpr csv domain{"local"};

public:
  MOD_ID("mdns.avahi");
};

} // namespace mdns
} // namespace beacon

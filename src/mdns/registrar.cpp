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

#include "mdns/registrar.hpp"
#include "base/logger.hpp"

#include <fmt/format.h>
#include <numeric>

namespace beacon {
namespace mdns {

TxtEntries Registrar::make_txt(const conf::ServiceConfig &cfg) noexcept {
  TxtEntries txt{"vers=3.0", "nt=hardware", "flags=1"};

  txt.emplace_back(fmt::format("workgroup={}", cfg.workgroup));

  if (!cfg.description.empty()) {
    txt.emplace_back(fmt::format("description={}", cfg.description));
  }

  for (size_t i = 0; i < cfg.shares.size(); i++) {
    const auto &share = cfg.shares[i];

    txt.emplace_back(
        fmt::format("share{}=name={};path={};comment={}", i, share.name, share.path, share.comment));
  }

  return txt;
}

result<void, RegistrationError> Registrar::check_txt(const TxtEntries &txt) noexcept {

  for (const auto &entry : txt) {
    if (entry.size() > max_txt_entry) {
      return outcome::failure(RegistrationError{
          RegistrationError::TxtTooLarge,
          fmt::format("entry '{:.16}...' is {} bytes (max {})", entry, entry.size(), max_txt_entry)});
    }
  }

  // each entry is encoded as a length byte followed by the entry
  const auto total = std::accumulate(txt.begin(), txt.end(), size_t{0},
                                     [](size_t sum, const auto &e) { return sum + 1 + e.size(); });

  if (total > max_txt_total) {
    return outcome::failure(RegistrationError{
        RegistrationError::TxtTooLarge,
        fmt::format("encoded TXT is {} bytes (max {})", total, max_txt_total)});
  }

  return outcome::success();
}

Advert Registrar::make_advert(const conf::ServiceConfig &cfg, const IpAddrV4 &bind_ip) noexcept {
  return Advert{.service_type = cfg.service_type,
                .instance_name = cfg.instance_name,
                .host_fqdn = cfg.hostname_fqdn(),
                .port = cfg.port,
                .bind_ip = bind_ip,
                .txt = make_txt(cfg)};
}

result<Handle, RegistrationError> Registrar::register_service(const conf::ServiceConfig &cfg,
                                                              const IpAddrV4 &bind_ip) noexcept {
  INFO_AUTO_CAT("register");

  if (live.has_value()) {
    return outcome::failure(RegistrationError{RegistrationError::AlreadyRegistered,
                                              fmt::format("handle={} is live", live->id)});
  }

  auto advert = make_advert(cfg, bind_ip);

  if (auto checked = check_txt(advert.txt); !checked) return outcome::failure(checked.error());

  auto published = backend->publish(advert);

  if (!published) {
    const auto &err = published.error();

    return outcome::failure(RegistrationError{
        RegistrationError::Backend,
        (err.kind == RegistrationError::Backend) ? err.cause : describe(err)});
  }

  live.emplace(published.value());

  INFO_AUTO("{} '{}' host={} {}:{} handle={}", advert.service_type, advert.instance_name,
            advert.host_fqdn, advert.bind_ip.to_string(), advert.port, live->id);

  return outcome::success(*live);
}

bool Registrar::release(Handle handle) noexcept {
  if (!live.has_value() || (*live != handle)) return false;

  live.reset();
  return true;
}

result<void, RegistrationError> Registrar::withdraw(Backend &backend, Handle handle) noexcept {
  auto withdrawn = backend.withdraw(handle);
  if (withdrawn) return outcome::success();

  const auto &err = withdrawn.error();

  return outcome::failure(RegistrationError{
      RegistrationError::Backend,
      (err.kind == RegistrationError::Backend) ? err.cause : describe(err)});
}

result<void, RegistrationError> Registrar::unregister(Handle handle) noexcept {
  INFO_AUTO_CAT("unregister");

  if (!release(handle)) {
    INFO_AUTO("handle={} already released", handle.id);
    return outcome::success();
  }

  if (auto rc = withdraw(*backend, handle); !rc) return rc;

  INFO_AUTO("handle={} withdrawn", handle.id);

  return outcome::success();
}

} // namespace mdns
} // namespace beacon

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

#include "conf/service_config.hpp"
#include "base/asio.hpp"

#include <ArduinoJson.h>
#include <algorithm>
#include <array>
#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <fmt/format.h>
#include <fmt/os.h>
#include <fmt/std.h>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace beacon {
namespace conf {

namespace fs = std::filesystem;

namespace {

constexpr csv local_suffix{".local"};

// JSON keys
struct key {
  static constexpr auto service_name{"service_name"};
  static constexpr auto instance_name{"instance_name"};
  static constexpr auto port{"port"};
  static constexpr auto hostname{"hostname"};
  static constexpr auto workgroup{"workgroup"};
  static constexpr auto description{"description"};
  static constexpr auto bind_address{"bind_address"};
  static constexpr auto shares{"shares"};
  static constexpr auto name{"name"};
  static constexpr auto path{"path"};
  static constexpr auto comment{"comment"};
};

auto invalid(string field, string detail) noexcept {
  return outcome::failure(ConfigError{ConfigError::Invalid, std::move(field), std::move(detail)});
}

// required string member, Invalid(field) when missing or not a string
result<string, ConfigError> required_string(JsonObjectConst obj, const char *k,
                                            const string &field) noexcept {
  auto v = obj[k];

  if (v.isNull()) return invalid(field, "missing required field");
  if (!v.is<const char *>()) return invalid(field, "must be a string");

  return outcome::success(string(v.as<const char *>()));
}

// optional string member, returns the default when missing or null
result<string, ConfigError> optional_string(JsonObjectConst obj, const char *k, const string &field,
                                            csv def_val) noexcept {
  auto v = obj[k];

  if (v.isNull()) return outcome::success(string(def_val));
  if (!v.is<const char *>()) return invalid(field, "must be a string");

  return outcome::success(string(v.as<const char *>()));
}

bool valid_label_char(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || (c == '-');
}

// members of the root object into an unvalidated ServiceConfig
result<ServiceConfig, ConfigError> from_json(JsonObjectConst root) noexcept {
  ServiceConfig cfg;

  auto stype = required_string(root, key::service_name, key::service_name);
  if (!stype) return outcome::failure(stype.error());
  cfg.service_type = std::move(stype).value();

  auto iname = required_string(root, key::instance_name, key::instance_name);
  if (!iname) return outcome::failure(iname.error());
  cfg.instance_name = std::move(iname).value();

  // port is range checked here, before narrowing to Port
  if (auto v = root[key::port]; v.isNull()) {
    return invalid(key::port, "missing required field");
  } else if (!v.is<int64_t>()) {
    return invalid(key::port, "must be an integer");
  } else if (const auto port = v.as<int64_t>(); (port < 1) || (port > 65535)) {
    return invalid(key::port, fmt::format("{} not in [1, 65535]", port));
  } else {
    cfg.port = static_cast<Port>(port);
  }

  auto host = required_string(root, key::hostname, key::hostname);
  if (!host) return outcome::failure(host.error());
  cfg.hostname = std::move(host).value();

  auto wg = optional_string(root, key::workgroup, key::workgroup, ServiceConfig::def_workgroup);
  if (!wg) return outcome::failure(wg.error());
  cfg.workgroup = std::move(wg).value();

  auto desc = optional_string(root, key::description, key::description, "");
  if (!desc) return outcome::failure(desc.error());
  cfg.description = std::move(desc).value();

  if (auto v = root[key::bind_address]; !v.isNull()) {
    if (!v.is<const char *>()) return invalid(key::bind_address, "must be a string");

    cfg.bind_address.emplace(v.as<const char *>());
  }

  auto shares_v = root[key::shares];
  if (shares_v.isNull()) return invalid(key::shares, "missing required field");
  if (!shares_v.is<JsonArrayConst>()) return invalid(key::shares, "must be an array");

  auto idx{0};
  for (JsonVariantConst share_v : shares_v.as<JsonArrayConst>()) {
    const auto prefix = fmt::format("{}[{}]", key::shares, idx++);

    if (!share_v.is<JsonObjectConst>()) return invalid(prefix, "must be an object");
    const auto share_obj = share_v.as<JsonObjectConst>();

    auto name = required_string(share_obj, key::name, fmt::format("{}.{}", prefix, key::name));
    if (!name) return outcome::failure(name.error());

    auto path = required_string(share_obj, key::path, fmt::format("{}.{}", prefix, key::path));
    if (!path) return outcome::failure(path.error());

    auto comment =
        optional_string(share_obj, key::comment, fmt::format("{}.{}", prefix, key::comment), "");
    if (!comment) return outcome::failure(comment.error());

    cfg.shares.emplace_back(ShareDefinition{.name = std::move(name).value(),
                                            .path = std::move(path).value(),
                                            .comment = std::move(comment).value()});
  }

  return outcome::success(std::move(cfg));
}

} // namespace

std::optional<string> normalize_hostname(csv raw) noexcept {
  string host(raw);

  if (!host.empty() && (host.back() == '.')) host.pop_back();

  if (!boost::algorithm::iends_with(host, local_suffix)) host.append(local_suffix);

  const csv label{host.data(), host.size() - local_suffix.size()};

  if (label.empty() || (label.front() == '-') || (label.back() == '-')) return std::nullopt;
  if (!std::all_of(label.begin(), label.end(), valid_label_char)) return std::nullopt;

  return host;
}

bool valid_service_type(csv stype) noexcept {
  static const std::regex re{R"(^_[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?\._(tcp|udp)\.local\.$)"};

  return std::regex_match(stype.begin(), stype.end(), re);
}

ServiceConfig ServiceConfig::defaults() noexcept {
  return ServiceConfig{.service_type = "_smb._tcp.local.",
                       .instance_name = "Samba-Share",
                       .port = 445,
                       .hostname = default_hostname(),
                       .workgroup = string(def_workgroup),
                       .description = "Samba share via mDNS",
                       .bind_address = std::nullopt,
                       .shares = {ShareDefinition{.name = "Public",
                                                  .path = "/srv/samba/public",
                                                  .comment = "Public shared folder"}}};
}

string default_hostname() noexcept {
  std::array<char, 256> buff{0x00};

  // first label of the system host name, when it is usable as an mDNS label
  if (::gethostname(buff.data(), buff.size() - 1) == 0) {
    const csv sys_name{buff.data()};

    if (auto host = normalize_hostname(sys_name.substr(0, sys_name.find('.'))); host.has_value()) {
      return std::move(host).value();
    }
  }

  return string(def_hostname);
}

result<ServiceConfig, ConfigError> ServiceConfig::load(const fs_path &file) noexcept {
  std::error_code ec;

  if (!fs::exists(file, ec) || ec) {
    return outcome::failure(ConfigError{ConfigError::NotFound, "", fmt::format("{}", file)});
  }

  std::ifstream ifs(file, std::ios::binary);
  if (!ifs.is_open()) {
    return outcome::failure(
        ConfigError{ConfigError::NotFound, "", fmt::format("unable to open {}", file)});
  }

  std::ostringstream ss;
  ss << ifs.rdbuf();

  return parse(ss.str());
}

result<ServiceConfig, ConfigError> ServiceConfig::parse(csv json) noexcept {
  // only known members are kept, unknown fields never consume document capacity
  StaticJsonDocument<512> filter;
  for (auto k : {key::service_name, key::instance_name, key::port, key::hostname, key::workgroup,
                 key::description, key::bind_address, key::shares}) {
    filter[k] = true;
  }

  // strings are copied into the document, allow for them plus the node pool.
  // every member and element is a fixed size slot so short, dense documents
  // can exceed the estimate, grow until the parse fits
  for (auto capacity = json.size() * 2 + 1024;; capacity *= 2) {
    DynamicJsonDocument doc(capacity);

    const auto err =
        deserializeJson(doc, json.data(), json.size(), DeserializationOption::Filter(filter));

    if ((err == DeserializationError::NoMemory) && (capacity < max_json_capacity)) continue;

    if (err) return outcome::failure(ConfigError{ConfigError::Malformed, "", err.c_str()});

    if (!doc.is<JsonObject>()) {
      return outcome::failure(ConfigError{ConfigError::Malformed, "", "root is not an object"});
    }

    auto cfg = from_json(doc.as<JsonObjectConst>());
    if (!cfg) return outcome::failure(cfg.error());

    return validated(std::move(cfg).value());
  }
}

result<ServiceConfig, ConfigError> ServiceConfig::validated(ServiceConfig cfg) noexcept {

  if (cfg.port == 0) return invalid(key::port, "port cannot be 0");

  if (cfg.hostname.empty()) return invalid(key::hostname, "cannot be empty");

  if (auto host = normalize_hostname(cfg.hostname); host.has_value()) {
    cfg.hostname = std::move(host).value();
  } else {
    return invalid(key::hostname,
                   fmt::format("'{}' must be alphanumeric and hyphens only", cfg.hostname));
  }

  if (!valid_service_type(cfg.service_type)) {
    return invalid(key::service_name,
                   fmt::format("'{}' must be _<name>._tcp.local. or _<name>._udp.local.",
                               cfg.service_type));
  }

  if (cfg.instance_name.empty()) return invalid(key::instance_name, "cannot be empty");

  if (cfg.instance_name.size() > max_instance_name) {
    return invalid(key::instance_name,
                   fmt::format("{} bytes exceeds {}", cfg.instance_name.size(), max_instance_name));
  }

  if (cfg.shares.empty()) return invalid(key::shares, "at least one share must be configured");

  for (size_t i = 0; i < cfg.shares.size(); i++) {
    const auto &share = cfg.shares[i];

    if (share.name.empty()) {
      return invalid(fmt::format("{}[{}].{}", key::shares, i, key::name), "cannot be empty");
    }

    if (share.path.empty()) {
      return invalid(fmt::format("{}[{}].{}", key::shares, i, key::path), "cannot be empty");
    }
  }

  if (cfg.bind_address.has_value()) {
    error_code ec;
    [[maybe_unused]] auto addr = asio::ip::make_address_v4(*cfg.bind_address, ec);

    if (ec) {
      return invalid(key::bind_address,
                     fmt::format("'{}' is not an IPv4 address", *cfg.bind_address));
    }
  }

  return outcome::success(std::move(cfg));
}

string ServiceConfig::to_json() const noexcept {
  size_t strings_len{0};
  for (const auto &s : shares) {
    strings_len += s.name.size() + s.path.size() + s.comment.size();
  }

  strings_len += service_type.size() + instance_name.size() + hostname.size() + workgroup.size() +
                 description.size() + bind_address.value_or(string()).size();

  DynamicJsonDocument doc(2048 + (strings_len * 2) + (shares.size() * 256));

  doc[key::service_name] = service_type;
  doc[key::instance_name] = instance_name;
  doc[key::port] = port;
  doc[key::hostname] = hostname;
  doc[key::workgroup] = workgroup;
  doc[key::description] = description;

  if (bind_address.has_value()) doc[key::bind_address] = *bind_address;

  auto shares_arr = doc.createNestedArray(key::shares);
  for (const auto &s : shares) {
    auto obj = shares_arr.createNestedObject();
    obj[key::name] = s.name;
    obj[key::path] = s.path;
    obj[key::comment] = s.comment;
  }

  string out;
  serializeJsonPretty(doc, out);

  return out;
}

result<void, ConfigError> ServiceConfig::save(const fs_path &file) const noexcept {
  if (auto checked = validated(*this); !checked) return outcome::failure(checked.error());

  try {
    if (file.has_parent_path()) fs::create_directories(file.parent_path());

    constexpr auto flags = fmt::file::WRONLY | fmt::file::CREATE | fmt::file::TRUNC;
    auto os = fmt::output_file(file.string(), flags);

    os.print("{}\n", to_json());
    os.close();

  } catch (const std::system_error &err) {
    // fs::filesystem_error derives from system_error
    return outcome::failure(ConfigError{ConfigError::NotFound, "",
                                        fmt::format("unable to write {}: {}", file, err.what())});
  }

  return outcome::success();
}

} // namespace conf
} // namespace beacon

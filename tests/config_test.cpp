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

#include <ArduinoJson.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

using namespace beacon;
using namespace beacon::conf;

class ServiceConfigTest : public ::testing::Test {
protected:
  ServiceConfigTest() : doc(16384) {}

  void SetUp() override {
    doc["service_name"] = "_smb._tcp.local.";
    doc["instance_name"] = "Samba-Share";
    doc["port"] = 445;
    doc["hostname"] = "pc";
    doc["workgroup"] = "WORKGROUP";
    doc["description"] = "Test share";

    auto shares = doc.createNestedArray("shares");
    auto share = shares.createNestedObject();
    share["name"] = "Public";
    share["path"] = "/srv/samba/public";
    share["comment"] = "Public folder";

    tmp_dir = std::filesystem::temp_directory_path() /
              ("beacon-config-test-" + std::to_string(::getpid()));
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(tmp_dir, ec);
  }

  std::string json() const {
    std::string out;
    serializeJson(doc, out);
    return out;
  }

  static void expect_invalid(const result<ServiceConfig, ConfigError> &rc, const std::string &field) {
    ASSERT_FALSE(rc);
    EXPECT_EQ(rc.error().kind, ConfigError::Invalid);
    EXPECT_EQ(rc.error().field, field);
  }

  DynamicJsonDocument doc;
  std::filesystem::path tmp_dir;
};

TEST_F(ServiceConfigTest, ParsesValidConfig) {
  auto rc = ServiceConfig::parse(json());

  ASSERT_TRUE(rc) << describe(rc.error());

  const auto &cfg = rc.value();
  EXPECT_EQ(cfg.service_type, "_smb._tcp.local.");
  EXPECT_EQ(cfg.instance_name, "Samba-Share");
  EXPECT_EQ(cfg.port, 445);
  EXPECT_EQ(cfg.hostname, "pc.local");
  EXPECT_EQ(cfg.hostname_fqdn(), "pc.local.");
  EXPECT_EQ(cfg.workgroup, "WORKGROUP");
  EXPECT_EQ(cfg.description, "Test share");
  EXPECT_FALSE(cfg.bind_address.has_value());

  ASSERT_EQ(cfg.shares.size(), 1u);
  EXPECT_EQ(cfg.shares[0].name, "Public");
  EXPECT_EQ(cfg.shares[0].path, "/srv/samba/public");
  EXPECT_EQ(cfg.shares[0].comment, "Public folder");
}

TEST_F(ServiceConfigTest, PortZeroRejected) {
  doc["port"] = 0;

  expect_invalid(ServiceConfig::parse(json()), "port");
}

TEST_F(ServiceConfigTest, PortAboveRangeRejected) {
  doc["port"] = 65536;

  expect_invalid(ServiceConfig::parse(json()), "port");
}

TEST_F(ServiceConfigTest, NegativePortRejected) {
  doc["port"] = -1;

  expect_invalid(ServiceConfig::parse(json()), "port");
}

TEST_F(ServiceConfigTest, PortUpperBoundAccepted) {
  doc["port"] = 65535;

  auto rc = ServiceConfig::parse(json());

  ASSERT_TRUE(rc);
  EXPECT_EQ(rc.value().port, 65535);
}

TEST_F(ServiceConfigTest, PortMustBeInteger) {
  doc["port"] = "445";

  expect_invalid(ServiceConfig::parse(json()), "port");
}

TEST_F(ServiceConfigTest, MissingRequiredFieldNamed) {
  doc.remove("instance_name");

  expect_invalid(ServiceConfig::parse(json()), "instance_name");
}

TEST_F(ServiceConfigTest, MissingSharesNamed) {
  doc.remove("shares");

  expect_invalid(ServiceConfig::parse(json()), "shares");
}

TEST_F(ServiceConfigTest, EmptySharesRejected) {
  doc.remove("shares");
  doc.createNestedArray("shares");

  expect_invalid(ServiceConfig::parse(json()), "shares");
}

TEST_F(ServiceConfigTest, ShareWithoutNameNamesIndex) {
  auto second = doc["shares"].createNestedObject();
  second["path"] = "/srv/media";

  expect_invalid(ServiceConfig::parse(json()), "shares[1].name");
}

TEST_F(ServiceConfigTest, ShareWithEmptyPathNamesIndex) {
  doc["shares"][0]["path"] = "";

  expect_invalid(ServiceConfig::parse(json()), "shares[0].path");
}

TEST_F(ServiceConfigTest, OptionalFieldsDefault) {
  doc.remove("workgroup");
  doc.remove("description");
  doc["shares"][0].remove("comment");

  auto rc = ServiceConfig::parse(json());

  ASSERT_TRUE(rc);
  EXPECT_EQ(rc.value().workgroup, "WORKGROUP");
  EXPECT_TRUE(rc.value().description.empty());
  EXPECT_TRUE(rc.value().shares[0].comment.empty());
}

TEST_F(ServiceConfigTest, InstanceNameLengthLimit) {
  doc["instance_name"] = std::string(63, 'a');
  EXPECT_TRUE(ServiceConfig::parse(json()));

  doc["instance_name"] = std::string(64, 'a');
  expect_invalid(ServiceConfig::parse(json()), "instance_name");

  doc["instance_name"] = "";
  expect_invalid(ServiceConfig::parse(json()), "instance_name");
}

TEST_F(ServiceConfigTest, ServiceTypeMustBeFullyQualified) {
  doc["service_name"] = "_smb._tcp.local";

  expect_invalid(ServiceConfig::parse(json()), "service_name");
}

TEST_F(ServiceConfigTest, BindAddressOverride) {
  doc["bind_address"] = "10.0.0.5";

  auto rc = ServiceConfig::parse(json());

  ASSERT_TRUE(rc);
  ASSERT_TRUE(rc.value().bind_address.has_value());
  EXPECT_EQ(*rc.value().bind_address, "10.0.0.5");
}

TEST_F(ServiceConfigTest, BindAddressMustBeIPv4) {
  doc["bind_address"] = "999.1.1.1";
  expect_invalid(ServiceConfig::parse(json()), "bind_address");

  doc["bind_address"] = "fe80::1";
  expect_invalid(ServiceConfig::parse(json()), "bind_address");
}

TEST_F(ServiceConfigTest, MalformedJson) {
  auto rc = ServiceConfig::parse(R"({"service_name": "_smb._tcp.local.", )");

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, ConfigError::Malformed);
}

TEST_F(ServiceConfigTest, RootMustBeObject) {
  auto rc = ServiceConfig::parse("[1, 2, 3]");

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, ConfigError::Malformed);
}

TEST_F(ServiceConfigTest, ManyShortSharesAccepted) {
  std::string shares;
  for (auto i = 0; i < 30; i++) {
    shares.append(fmt::format(R"({}{{"name":"s{}","path":"/a","comment":""}})", i ? "," : "", i));
  }

  const auto text = fmt::format(R"({{"service_name":"_smb._tcp.local.","instance_name":"pc",)"
                                R"("port":445,"hostname":"pc","shares":[{}]}})",
                                shares);

  auto rc = ServiceConfig::parse(text);

  ASSERT_TRUE(rc) << describe(rc.error());
  ASSERT_EQ(rc.value().shares.size(), 30u);
  EXPECT_EQ(rc.value().shares[29].name, "s29");
  EXPECT_EQ(rc.value().shares[29].path, "/a");
}

TEST_F(ServiceConfigTest, LargeUnknownFieldIgnored) {
  auto tags = doc.createNestedArray("tags");
  for (auto i = 0; i < 100; i++) {
    tags.add(i);
  }

  auto extra = doc.createNestedObject("extra");
  for (auto i = 0; i < 50; i++) {
    extra[fmt::format("k{}", i)] = i;
  }

  ASSERT_FALSE(doc.overflowed());

  auto rc = ServiceConfig::parse(json());

  ASSERT_TRUE(rc) << describe(rc.error());
  EXPECT_EQ(rc.value().instance_name, "Samba-Share");
  EXPECT_EQ(rc.value().shares.size(), 1u);
}

TEST_F(ServiceConfigTest, DefaultsAreValidForLinux) {
  const auto cfg = ServiceConfig::defaults();

  auto rc = ServiceConfig::validated(cfg);

  ASSERT_TRUE(rc) << describe(rc.error());
  EXPECT_EQ(rc.value(), cfg);
  EXPECT_TRUE(cfg.hostname.ends_with(".local"));
  EXPECT_EQ(cfg.hostname, default_hostname());

  ASSERT_EQ(cfg.shares.size(), 1u);
  EXPECT_TRUE(cfg.shares[0].path.starts_with("/"));
}

TEST_F(ServiceConfigTest, MissingFileIsNotFound) {
  auto rc = ServiceConfig::load(tmp_dir / "does-not-exist.json");

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, ConfigError::NotFound);
}

TEST_F(ServiceConfigTest, JsonRoundTrip) {
  auto cfg = ServiceConfig::defaults();
  cfg.bind_address = "192.168.1.11";
  cfg.shares.push_back(ShareDefinition{.name = "Media", .path = "/srv/media", .comment = ""});

  auto rc = ServiceConfig::parse(cfg.to_json());

  ASSERT_TRUE(rc) << describe(rc.error());
  EXPECT_EQ(rc.value(), cfg);
}

TEST_F(ServiceConfigTest, SaveThenLoad) {
  const auto file = tmp_dir / "nested" / "config.json";
  const auto cfg = ServiceConfig::defaults();

  ASSERT_TRUE(cfg.save(file));
  ASSERT_TRUE(std::filesystem::exists(file));

  auto rc = ServiceConfig::load(file);

  ASSERT_TRUE(rc) << describe(rc.error());
  EXPECT_EQ(rc.value(), cfg);
}

TEST_F(ServiceConfigTest, SaveRefusesInvalidConfig) {
  auto cfg = ServiceConfig::defaults();
  cfg.port = 0;

  auto rc = cfg.save(tmp_dir / "config.json");

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, ConfigError::Invalid);
  EXPECT_FALSE(std::filesystem::exists(tmp_dir / "config.json"));
}

TEST(HostnameTest, LocalSuffixAppended) {
  EXPECT_EQ(normalize_hostname("pc"), "pc.local");
  EXPECT_EQ(normalize_hostname("pc.local"), "pc.local");
  EXPECT_EQ(normalize_hostname("pc.local."), "pc.local");
  EXPECT_EQ(normalize_hostname("PC.LOCAL"), "PC.LOCAL");
  EXPECT_EQ(normalize_hostname("fileserver"), "fileserver.local");
}

TEST(HostnameTest, InvalidLabelsRejected) {
  EXPECT_FALSE(normalize_hostname(""));
  EXPECT_FALSE(normalize_hostname(".local"));
  EXPECT_FALSE(normalize_hostname("-pc"));
  EXPECT_FALSE(normalize_hostname("pc-"));
  EXPECT_FALSE(normalize_hostname("my_pc"));
  EXPECT_FALSE(normalize_hostname("pc.example"));
}

TEST(ServiceTypeTest, Validation) {
  EXPECT_TRUE(valid_service_type("_smb._tcp.local."));
  EXPECT_TRUE(valid_service_type("_http._udp.local."));
  EXPECT_TRUE(valid_service_type("_device-info._tcp.local."));

  EXPECT_FALSE(valid_service_type("_smb._tcp.local"));
  EXPECT_FALSE(valid_service_type("smb._tcp.local."));
  EXPECT_FALSE(valid_service_type("_smb._sctp.local."));
  EXPECT_FALSE(valid_service_type("_smb-._tcp.local."));
  EXPECT_FALSE(valid_service_type(""));
}

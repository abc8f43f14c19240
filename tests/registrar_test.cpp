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
#include "fakes.hpp"
#include "mdns/registrar.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <memory>
#include <numeric>

using namespace beacon;
using namespace beacon::mdns;

class RegistrarTest : public ::testing::Test {
protected:
  void SetUp() override {
    backend = std::make_shared<test::FakeBackend>();
    registrar = std::make_unique<Registrar>(backend);

    cfg = conf::ServiceConfig::defaults();
    cfg.instance_name = "pc";
    cfg.hostname = "pc.local";
    cfg.description = "Office";
    cfg.shares = {conf::ShareDefinition{.name = "Public", .path = "/srv/public", .comment = "all"},
                  conf::ShareDefinition{.name = "Media", .path = "/srv/media", .comment = ""}};
  }

  std::shared_ptr<test::FakeBackend> backend;
  std::unique_ptr<Registrar> registrar;
  conf::ServiceConfig cfg;
  const IpAddrV4 bind_ip{asio::ip::make_address_v4("192.168.1.11")};
};

TEST_F(RegistrarTest, TxtEntriesInOrder) {
  const auto txt = Registrar::make_txt(cfg);

  const TxtEntries expected{"vers=3.0",
                            "nt=hardware",
                            "flags=1",
                            "workgroup=WORKGROUP",
                            "description=Office",
                            "share0=name=Public;path=/srv/public;comment=all",
                            "share1=name=Media;path=/srv/media;comment="};

  EXPECT_EQ(txt, expected);
}

TEST_F(RegistrarTest, EmptyDescriptionOmitted) {
  cfg.description.clear();

  const auto txt = Registrar::make_txt(cfg);

  EXPECT_EQ(std::count_if(txt.begin(), txt.end(),
                          [](const auto &e) { return e.starts_with("description="); }),
            0);
}

TEST_F(RegistrarTest, PublishesScenarioAdvert) {
  cfg.service_type = "_smb._tcp.local.";
  cfg.port = 445;

  auto rc = registrar->register_service(cfg, bind_ip);

  ASSERT_TRUE(rc);
  ASSERT_EQ(backend->adverts.size(), 1u);

  const auto &advert = backend->adverts.front();
  EXPECT_EQ(advert.service_type, "_smb._tcp.local.");
  EXPECT_EQ(advert.instance_name, "pc");
  EXPECT_EQ(advert.host_fqdn, "pc.local.");
  EXPECT_EQ(advert.port, 445);
  EXPECT_EQ(advert.bind_ip, bind_ip);
  EXPECT_EQ(advert.txt, Registrar::make_txt(cfg));

  ASSERT_TRUE(registrar->handle().has_value());
  EXPECT_EQ(*registrar->handle(), rc.value());
}

TEST_F(RegistrarTest, SecondRegisterIsAlreadyRegistered) {
  ASSERT_TRUE(registrar->register_service(cfg, bind_ip));

  auto rc = registrar->register_service(cfg, bind_ip);

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, RegistrationError::AlreadyRegistered);
  EXPECT_EQ(backend->publish_calls.load(), 1);
}

TEST_F(RegistrarTest, BackendFailureWrapped) {
  backend->publish_script.push_back(
      RegistrationError{RegistrationError::Backend, "daemon not running"});

  auto rc = registrar->register_service(cfg, bind_ip);

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, RegistrationError::Backend);
  EXPECT_EQ(rc.error().cause, "daemon not running");
  EXPECT_FALSE(registrar->handle().has_value());
}

TEST_F(RegistrarTest, OversizedEntryIsTxtTooLarge) {
  cfg.description = std::string(250, 'd'); // plus "description=" is over 255

  auto rc = registrar->register_service(cfg, bind_ip);

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, RegistrationError::TxtTooLarge);
  EXPECT_EQ(backend->publish_calls.load(), 0);
}

TEST_F(RegistrarTest, OversizedTotalIsTxtTooLarge) {
  cfg.shares.clear();

  for (auto i = 0; i < 12; i++) {
    cfg.shares.push_back(conf::ShareDefinition{
        .name = fmt::format("share-{}", i), .path = std::string(80, 'p'), .comment = "c"});
  }

  const auto txt = Registrar::make_txt(cfg);
  const auto total = std::accumulate(txt.begin(), txt.end(), size_t{0},
                                     [](size_t sum, const auto &e) { return sum + 1 + e.size(); });
  ASSERT_GT(total, Registrar::max_txt_total);

  auto rc = registrar->register_service(cfg, bind_ip);

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, RegistrationError::TxtTooLarge);
  EXPECT_EQ(backend->publish_calls.load(), 0);
}

TEST_F(RegistrarTest, EntryAtLimitAccepted) {
  TxtEntries txt{std::string(Registrar::max_txt_entry, 'x')};

  EXPECT_TRUE(Registrar::check_txt(txt));

  txt.front().push_back('x');
  EXPECT_FALSE(Registrar::check_txt(txt));
}

TEST_F(RegistrarTest, UnregisterIsIdempotent) {
  auto rc = registrar->register_service(cfg, bind_ip);
  ASSERT_TRUE(rc);

  EXPECT_TRUE(registrar->unregister(rc.value()));
  EXPECT_TRUE(registrar->unregister(rc.value()));

  EXPECT_EQ(backend->withdraw_calls.load(), 1);
  EXPECT_FALSE(registrar->handle().has_value());
}

TEST_F(RegistrarTest, UnregisterFailureReleasesHandle) {
  backend->withdraw_error = RegistrationError{RegistrationError::Backend, "gone"};

  auto rc = registrar->register_service(cfg, bind_ip);
  ASSERT_TRUE(rc);

  auto unreg = registrar->unregister(rc.value());

  ASSERT_FALSE(unreg);
  EXPECT_EQ(unreg.error().kind, RegistrationError::Backend);
  EXPECT_FALSE(registrar->handle().has_value());

  // released, a register is allowed again
  EXPECT_TRUE(registrar->register_service(cfg, bind_ip));
}

TEST_F(RegistrarTest, ReleaseDropsHandleWithoutBackend) {
  auto rc = registrar->register_service(cfg, bind_ip);
  ASSERT_TRUE(rc);

  EXPECT_FALSE(registrar->release(Handle{rc.value().id + 1}));
  EXPECT_TRUE(registrar->release(rc.value()));
  EXPECT_FALSE(registrar->release(rc.value()));

  EXPECT_FALSE(registrar->handle().has_value());
  EXPECT_EQ(backend->withdraw_calls.load(), 0);
}

TEST_F(RegistrarTest, WithdrawWrapsBackendError) {
  backend->withdraw_error = RegistrationError{RegistrationError::AlreadyRegistered, "odd"};

  auto rc = Registrar::withdraw(*backend, Handle{7});

  ASSERT_FALSE(rc);
  EXPECT_EQ(rc.error().kind, RegistrationError::Backend);
  EXPECT_NE(rc.error().cause.find("AlreadyRegistered"), std::string::npos);

  ASSERT_EQ(backend->withdrawn.size(), 1u);
  EXPECT_EQ(backend->withdrawn.front().id, 7u);
}

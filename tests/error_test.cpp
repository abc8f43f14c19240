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


#include "base/error.hpp"

#include <gtest/gtest.h>

using namespace beacon;

TEST(ErrorTest, ExitCodePerDomain) {
  EXPECT_EQ(exit_code_for(ConfigError{ConfigError::Invalid, "port", ""}), 2);
  EXPECT_EQ(exit_code_for(AdapterError{AdapterError::NoSuitableAdapter, ""}), 3);
  EXPECT_EQ(exit_code_for(RegistrationError{RegistrationError::TxtTooLarge, ""}), 4);
  EXPECT_EQ(exit_code_for(ServiceControlError{ServiceControlError::PermissionDenied, ""}), 5);

  EXPECT_EQ(exit_code::ok, 0);
  EXPECT_EQ(exit_code::usage, 1);
}

TEST(ErrorTest, DescribeConfigNamesField) {
  const auto msg = describe(ConfigError{ConfigError::Invalid, "shares[1].name", "empty"});

  EXPECT_EQ(msg, "config Invalid field=shares[1].name (empty)");
}

TEST(ErrorTest, DescribeOmitsEmptyDetail) {
  EXPECT_EQ(describe(AdapterError{AdapterError::NoSuitableAdapter, ""}),
            "adapter NoSuitableAdapter");
  EXPECT_EQ(describe(RegistrationError{RegistrationError::AlreadyRegistered, ""}),
            "registration AlreadyRegistered");
  EXPECT_EQ(describe(ServiceControlError{ServiceControlError::NotInstalled, ""}),
            "service control NotInstalled");
}

TEST(ErrorTest, DescribeComposedError) {
  const Error err{RegistrationError{RegistrationError::Backend, "daemon not running"}};

  EXPECT_EQ(describe(err), "registration Backend (daemon not running)");
}

TEST(ErrorTest, KindNames) {
  EXPECT_EQ(kind_name(ConfigError::NotFound), "NotFound");
  EXPECT_EQ(kind_name(ConfigError::Malformed), "Malformed");
  EXPECT_EQ(kind_name(AdapterError::InvalidOverride), "InvalidOverride");
  EXPECT_EQ(kind_name(RegistrationError::TxtTooLarge), "TxtTooLarge");
  EXPECT_EQ(kind_name(ServiceControlError::AlreadyInstalled), "AlreadyInstalled");
  EXPECT_EQ(kind_name(ServiceControlError::Backend), "Backend");
}

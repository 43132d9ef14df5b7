/*  Copyright 2012 MaidSafe.net limited

    This MaidSafe Software is licensed to you under (1) the MaidSafe.net Commercial License,
    version 1.0 or later, or (2) The General Public License (GPL), version 3, depending on which
    licence you accepted on initial access to the Software (the "Licences").

    By contributing code to the MaidSafe Software, or to this project generally, you agree to be
    bound by the terms of the MaidSafe Contributor Agreement, version 1.0, found in the root
    directory of this project at LICENSE, COPYING and CONTRIBUTOR respectively and also
    available at: http://www.maidsafe.net/licenses

    Unless required by applicable law or agreed to in writing, the MaidSafe Software distributed
    under the GPL Licence is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS
    OF ANY KIND, either express or implied.

    See the Licences for the specific language governing permissions and limitations relating to
    use of the MaidSafe Software.                                                                 */

#include "boost/asio/error.hpp"
#include "boost/asio/io_service.hpp"
#include "boost/date_time/posix_time/posix_time.hpp"
#include "gtest/gtest.h"

#include "natcheck/utils.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;

namespace natcheck {

namespace test {

TEST(UtilsTest, BEH_ResolveIpv4) {
  asio::io_service io_service;
  boost::system::error_code ec;
  EXPECT_EQ(ip::address_v4::from_string("203.0.113.5"),
            ResolveIpv4(io_service, "203.0.113.5", ec));
  EXPECT_FALSE(ec);

  ip::address_v4 localhost(ResolveIpv4(io_service, "localhost", ec));
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_TRUE(localhost.is_loopback());
}

TEST(UtilsTest, BEH_ResolveProxyEndpoint) {
  asio::io_service io_service;
  boost::system::error_code ec;
  EXPECT_EQ(ip::tcp::endpoint(ip::address_v4::from_string("192.0.2.10"), 1080),
            ResolveProxyEndpoint(io_service, "192.0.2.10:1080", ec));
  EXPECT_FALSE(ec);

  ip::tcp::endpoint endpoint(ResolveProxyEndpoint(io_service, "localhost:9050", ec));
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_TRUE(endpoint.address().is_loopback());
  EXPECT_EQ(9050, endpoint.port());

  const char* const kInvalid[] = {"192.0.2.10", "192.0.2.10:", ":1080", "192.0.2.10:0",
                                  "192.0.2.10:65536", "192.0.2.10:10a", "192.0.2.10:-1"};
  for (const char* address : kInvalid) {
    ResolveProxyEndpoint(io_service, address, ec);
    EXPECT_EQ(asio::error::invalid_argument, ec) << address;
  }
}

TEST(UtilsTest, BEH_ParseTimeout) {
  boost::system::error_code ec;
  boost::optional<Timeout> timeout(ParseTimeout("3000", ec));
  EXPECT_FALSE(ec);
  ASSERT_TRUE(timeout.is_initialized());
  EXPECT_EQ(boost::posix_time::milliseconds(3000), *timeout);

  timeout = ParseTimeout("1", ec);
  EXPECT_FALSE(ec);
  ASSERT_TRUE(timeout.is_initialized());
  EXPECT_EQ(boost::posix_time::milliseconds(1), *timeout);

  // Zero disables the timeout.
  timeout = ParseTimeout("0", ec);
  EXPECT_FALSE(ec);
  EXPECT_FALSE(timeout.is_initialized());

  // A negative value must not wrap round to a huge timeout.
  const char* const kInvalid[] = {"-1", "-4294967295", "+5", "", " 10", "10ms", "1.5",
                                  "99999999999999999999999"};
  for (const char* milliseconds : kInvalid) {
    timeout = ParseTimeout(milliseconds, ec);
    EXPECT_EQ(asio::error::invalid_argument, ec) << '"' << milliseconds << '"';
    EXPECT_FALSE(timeout.is_initialized()) << '"' << milliseconds << '"';
  }
}

}  // namespace test

}  // namespace natcheck

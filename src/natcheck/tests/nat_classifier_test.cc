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
#include "boost/system/system_error.hpp"
#include "gtest/gtest.h"

#include "natcheck/nat_classifier.h"
#include "natcheck/packets/probe_request.h"
#include "natcheck/tests/fake_transport.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;

namespace natcheck {

namespace test {

class NatClassifierTest : public testing::Test {
 protected:
  NatClassifierTest()
      : first_server_(ip::address_v4::from_string("198.51.100.1")),
        second_server_(ip::address_v4::from_string("198.51.100.2")),
        first_(),
        second_() {}

  // Scripts a full set of responses on transport.  The cross-port reply is only scripted when
  // cross_port_reply is true.
  void AddRound(FakeTransport& transport, uint16_t first_port, uint16_t second_port,
                bool cross_port_reply) {
    transport.AddResponse(detail::kEcho, MakeEndpoint("203.0.113.5", first_port),
                          Transport::Endpoint(first_server_, detail::kEchoPort));
    transport.AddResponse(detail::kCrossServer, MakeEndpoint("203.0.113.5", second_port),
                          Transport::Endpoint(second_server_, detail::kEchoPort));
    if (cross_port_reply) {
      transport.AddResponse(detail::kCrossPort, MakeEndpoint("203.0.113.5", first_port),
                            Transport::Endpoint(first_server_, detail::kReceiveOnlyPort));
    }
  }

  NatClassification Classify(boost::system::error_code& ec) {
    return ClassifyNat(first_, second_, first_server_, second_server_, ec);
  }

  const ip::address_v4 first_server_, second_server_;
  FakeTransport first_, second_;
};

TEST_F(NatClassifierTest, BEH_ClassA) {
  AddRound(first_, 40001, 40001, true);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kA, classification.nat_type);
  ASSERT_TRUE(classification.external_address.is_initialized());
  EXPECT_EQ(ip::address_v4::from_string("203.0.113.5"), *classification.external_address);
  EXPECT_TRUE(second_.sent().empty());
}

TEST_F(NatClassifierTest, BEH_ClassB) {
  AddRound(first_, 40001, 40001, false);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kB, classification.nat_type);
  ASSERT_TRUE(classification.external_address.is_initialized());
  EXPECT_EQ(ip::address_v4::from_string("203.0.113.5"), *classification.external_address);
  EXPECT_TRUE(second_.sent().empty());
}

TEST_F(NatClassifierTest, BEH_ClassC) {
  AddRound(first_, 40001, 40002, false);
  AddRound(second_, 40011, 40012, false);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kC, classification.nat_type);
  ASSERT_TRUE(classification.external_address.is_initialized());
  EXPECT_EQ(ip::address_v4::from_string("203.0.113.5"), *classification.external_address);
  EXPECT_FALSE(second_.sent().empty());
}

TEST_F(NatClassifierTest, BEH_ClassD) {
  AddRound(first_, 40001, 40002, false);
  AddRound(second_, 40011, 40039, false);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kD, classification.nat_type);
  EXPECT_TRUE(classification.external_address.is_initialized());
}

TEST_F(NatClassifierTest, BEH_CrossPortReplyIgnoredWhenPortsDiffer) {
  AddRound(first_, 40001, 40002, true);
  AddRound(second_, 40003, 40004, true);
  boost::system::error_code ec;
  EXPECT_EQ(NatType::kC, Classify(ec).nat_type);
  EXPECT_FALSE(ec);
}

TEST_F(NatClassifierTest, BEH_WrappedPortsWithEqualDeltas) {
  AddRound(first_, 65530, 65531, false);
  AddRound(second_, 5, 6, false);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kC, classification.nat_type);
}

TEST_F(NatClassifierTest, BEH_OnlyOneSideWrapped) {
  // 65530 -> 5 counts as 10, 40000 -> 40011 as 11.
  AddRound(first_, 65530, 40000, false);
  AddRound(second_, 5, 40011, false);
  boost::system::error_code ec;
  EXPECT_EQ(NatType::kD, Classify(ec).nat_type);
  EXPECT_FALSE(ec);
}

TEST_F(NatClassifierTest, BEH_FirstRoundTimeout) {
  first_.AddResponse(detail::kEcho, MakeEndpoint("203.0.113.5", 40001),
                     Transport::Endpoint(first_server_, detail::kEchoPort));
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kF, classification.nat_type);
  EXPECT_FALSE(classification.external_address.is_initialized());
  EXPECT_TRUE(second_.sent().empty());
}

TEST_F(NatClassifierTest, BEH_SecondRoundTimeout) {
  AddRound(first_, 40001, 40002, false);
  boost::system::error_code ec;
  NatClassification classification(Classify(ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(NatType::kF, classification.nat_type);
  EXPECT_FALSE(classification.external_address.is_initialized());
}

TEST_F(NatClassifierTest, BEH_ReceiveErrorPropagates) {
  first_.AddReceiveError(asio::error::connection_refused);
  boost::system::error_code ec;
  Classify(ec);
  EXPECT_EQ(asio::error::connection_refused, ec);
}

TEST_F(NatClassifierTest, BEH_SecondRoundSendErrorPropagates) {
  AddRound(first_, 40001, 40002, false);
  second_.FailSend(0, asio::error::network_unreachable);
  boost::system::error_code ec;
  Classify(ec);
  EXPECT_EQ(asio::error::network_unreachable, ec);
}

TEST_F(NatClassifierTest, BEH_ThrowingOverload) {
  first_.FailSend(0, asio::error::network_unreachable);
  try {
    ClassifyNat(first_, second_, first_server_, second_server_);
    GTEST_FAIL() << "Expected to throw";
  }
  catch(const boost::system::system_error& error) {
    EXPECT_EQ(asio::error::network_unreachable, error.code());
  }

  FakeTransport first, second;
  AddRound(first, 40001, 40001, true);
  EXPECT_EQ(NatType::kA, ClassifyNat(first, second, first_server_, second_server_).nat_type);
}

TEST(PortDeltaTest, BEH_PortDelta) {
  EXPECT_EQ(0, detail::PortDelta(40001, 40001));
  EXPECT_EQ(10, detail::PortDelta(40001, 40011));
  EXPECT_EQ(65535, detail::PortDelta(0, 65535));
  EXPECT_EQ(10, detail::PortDelta(65530, 5));
  EXPECT_EQ(65534, detail::PortDelta(1, 0));
}

}  // namespace test

}  // namespace natcheck

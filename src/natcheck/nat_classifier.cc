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

#include "natcheck/nat_classifier.h"

#include "boost/asio/error.hpp"
#include "boost/system/system_error.hpp"
#include "glog/logging.h"

#include "natcheck/probe_round.h"

namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

namespace detail {

uint16_t PortDelta(uint16_t from, uint16_t to) {
  if (to >= from)
    return static_cast<uint16_t>(to - from);
  return static_cast<uint16_t>(65535 - (from - to));
}

}  // namespace detail

namespace {

// Runs a round, turning a timeout into an inconclusive (empty) result.
boost::optional<detail::RoundResult> RunRound(Transport& transport,
                                              const ip::address_v4& first_server,
                                              const ip::address_v4& second_server,
                                              bs::error_code& ec) {
  detail::ProbeRound round(first_server, second_server);
  detail::RoundResult result(round.Run(transport, ec));
  if (ec == boost::asio::error::timed_out) {
    LOG(WARNING) << "Timed out waiting for rendezvous servers to reply";
    ec.clear();
    return boost::none;
  }
  if (ec)
    return boost::none;
  return result;
}

}  // unnamed namespace

NatClassification ClassifyNat(Transport& first, Transport& second,
                              const ip::address_v4& first_server,
                              const ip::address_v4& second_server, bs::error_code& ec) {
  boost::optional<detail::RoundResult> first_round(
      RunRound(first, first_server, second_server, ec));
  if (ec)
    return NatClassification();
  if (!first_round)
    return NatClassification(boost::none, NatType::kF);

  const ip::address_v4 external_address(first_round->first_server.address().to_v4());
  const uint16_t port_a1(first_round->first_server.port());
  const uint16_t port_b1(first_round->second_server.port());
  LOG(INFO) << "First round: " << first_round->first_server << " and "
            << first_round->second_server << (first_round->cross_port_reply ? " with" : " without")
            << " cross-port reply";

  if (port_a1 == port_b1) {
    return NatClassification(external_address,
                             first_round->cross_port_reply ? NatType::kA : NatType::kB);
  }

  boost::optional<detail::RoundResult> second_round(
      RunRound(second, first_server, second_server, ec));
  if (ec)
    return NatClassification();
  if (!second_round)
    return NatClassification(boost::none, NatType::kF);

  const uint16_t port_a2(second_round->first_server.port());
  const uint16_t port_b2(second_round->second_server.port());
  const uint16_t delta_a(detail::PortDelta(port_a1, port_a2));
  const uint16_t delta_b(detail::PortDelta(port_b1, port_b2));
  LOG(INFO) << "Second round: " << second_round->first_server << " and "
            << second_round->second_server << ", port deltas " << delta_a << " and " << delta_b;

  return NatClassification(external_address, delta_a == delta_b ? NatType::kC : NatType::kD);
}

NatClassification ClassifyNat(Transport& first, Transport& second,
                              const ip::address_v4& first_server,
                              const ip::address_v4& second_server) {
  bs::error_code ec;
  NatClassification classification(ClassifyNat(first, second, first_server, second_server, ec));
  if (ec)
    throw bs::system_error(ec, "NAT classification failed");
  return classification;
}

}  // namespace natcheck

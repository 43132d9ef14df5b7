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

#ifndef NATCHECK_NAT_CLASSIFIER_H_
#define NATCHECK_NAT_CLASSIFIER_H_

#include <cstdint>

#include "boost/asio/ip/address_v4.hpp"
#include "boost/optional/optional.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/nat_type.h"
#include "natcheck/transport.h"

namespace natcheck {

struct NatClassification {
  NatClassification() : external_address(), nat_type(NatType::kF) {}
  NatClassification(boost::optional<boost::asio::ip::address_v4> external_address_in,
                    NatType nat_type_in)
      : external_address(external_address_in), nat_type(nat_type_in) {}

  // Our public address as reported by the first server.  Absent when nat_type is kF.
  boost::optional<boost::asio::ip::address_v4> external_address;
  NatType nat_type;
};

// Classifies the NAT between this host and the two rendezvous servers.  A first round of probes
// is sent over first.  If both servers saw the same external port the NAT is A or B depending on
// whether an unsolicited reply got through.  Otherwise a second round is sent over second and the
// NAT is C if both servers saw the external port move by the same amount, D if not.
//
// A round which times out before both servers have replied yields kF without an error.  Any other
// failure is reported through ec.  Each transport should have a read timeout set, or an
// unresponsive server blocks forever.
NatClassification ClassifyNat(Transport& first, Transport& second,
                              const boost::asio::ip::address_v4& first_server,
                              const boost::asio::ip::address_v4& second_server,
                              boost::system::error_code& ec);

// As above, throwing boost::system::system_error on failure.
NatClassification ClassifyNat(Transport& first, Transport& second,
                              const boost::asio::ip::address_v4& first_server,
                              const boost::asio::ip::address_v4& second_server);

namespace detail {

// How far a NAT's port allocator moved from one mapping to the next, allowing for it to have
// wrapped past the top of the port range.
uint16_t PortDelta(uint16_t from, uint16_t to);

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_NAT_CLASSIFIER_H_

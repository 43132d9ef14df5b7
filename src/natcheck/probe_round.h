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

#ifndef NATCHECK_PROBE_ROUND_H_
#define NATCHECK_PROBE_ROUND_H_

#include <vector>

#include "boost/asio/buffer.hpp"
#include "boost/asio/ip/address_v4.hpp"
#include "boost/optional/optional.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/transport.h"
#include "natcheck/packets/probe_request.h"

namespace natcheck {

namespace detail {

struct RoundResult {
  RoundResult() : first_server(), second_server(), cross_port_reply(false) {}

  // Our endpoint as seen by each server's echo port.
  Transport::Endpoint first_server, second_server;
  // Whether the first server managed to reach us from a port we never sent to.
  bool cross_port_reply;
};

// One exchange of probes with a pair of rendezvous servers over a single transport.  All probes
// are sent first, then responses are collected until every expected one has arrived or a receive
// fails.
class ProbeRound {
 public:
  ProbeRound(const boost::asio::ip::address_v4& first_server,
             const boost::asio::ip::address_v4& second_server);

  // Any send error ends the round with that error.  A receive error is the round's error unless
  // both servers have already reported an endpoint, in which case the round succeeds with
  // whatever cross-port evidence has been gathered.
  RoundResult Run(Transport& transport, boost::system::error_code& ec);

  // Inspects one received datagram and records it if it is an expected response.  Returns true
  // if it was recorded.
  bool HandleDatagram(const boost::asio::const_buffer& datagram,
                      const Transport::Endpoint& sender);

  bool HaveEndpoints() const { return first_remote_ && second_remote_; }
  bool IsComplete() const { return HaveEndpoints() && saw_cross_port_reply_; }

 private:
  ProbeRound(const ProbeRound&);
  ProbeRound& operator=(const ProbeRound&);

  void Reset();
  void SendProbe(Transport& transport, const ProbePayload& payload,
                 const Transport::Endpoint& endpoint, boost::system::error_code& ec);
  RoundResult Result() const;

  const Transport::Endpoint send_only_endpoint_, echo_endpoint_, receive_only_endpoint_,
      second_echo_endpoint_;
  boost::optional<Transport::Endpoint> first_remote_, second_remote_;
  bool saw_cross_port_reply_;
  std::vector<unsigned char> receive_buffer_;
};

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_PROBE_ROUND_H_

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

#include "natcheck/probe_round.h"

#include "glog/logging.h"

#include "natcheck/parameters.h"
#include "natcheck/packets/probe_response.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

namespace detail {

ProbeRound::ProbeRound(const ip::address_v4& first_server, const ip::address_v4& second_server)
    : send_only_endpoint_(first_server, kSendOnlyPort),
      echo_endpoint_(first_server, kEchoPort),
      receive_only_endpoint_(first_server, kReceiveOnlyPort),
      second_echo_endpoint_(second_server, kEchoPort),
      first_remote_(),
      second_remote_(),
      saw_cross_port_reply_(false),
      receive_buffer_(Parameters::kMaxDatagramSize) {}

void ProbeRound::Reset() {
  first_remote_ = boost::none;
  second_remote_ = boost::none;
  saw_cross_port_reply_ = false;
}

void ProbeRound::SendProbe(Transport& transport, const ProbePayload& payload,
                           const Transport::Endpoint& endpoint, bs::error_code& ec) {
  for (uint32_t i(0); i != Parameters::probe_send_count; ++i) {
    transport.SendTo(asio::buffer(payload), endpoint, ec);
    if (ec) {
      LOG(ERROR) << "Failed to send probe " << static_cast<int>(payload[3]) << " to " << endpoint
                 << ": " << ec.message();
      return;
    }
  }
}

RoundResult ProbeRound::Run(Transport& transport, bs::error_code& ec) {
  Reset();
  SendProbe(transport, kSendOnlyPayload, send_only_endpoint_, ec);
  if (!ec)
    SendProbe(transport, kEchoPayload, echo_endpoint_, ec);
  if (!ec)
    SendProbe(transport, kCrossPortPayload, echo_endpoint_, ec);
  if (!ec)
    SendProbe(transport, kCrossServerPayload, second_echo_endpoint_, ec);
  if (ec)
    return RoundResult();

  while (!IsComplete()) {
    Transport::Endpoint sender;
    size_t length(transport.ReceiveFrom(asio::buffer(receive_buffer_), sender, ec));
    if (ec) {
      if (HaveEndpoints()) {
        VLOG(1) << "Receive ended with \"" << ec.message() << "\" after both endpoints were seen";
        ec.clear();
        break;
      }
      LOG(WARNING) << "Probe round failed before both servers replied: " << ec.message();
      return RoundResult();
    }
    HandleDatagram(asio::buffer(receive_buffer_, length), sender);
  }

  return Result();
}

bool ProbeRound::HandleDatagram(const asio::const_buffer& datagram,
                                const Transport::Endpoint& sender) {
  ProbeResponse response;
  if (response.Decode(datagram)) {
    VLOG(2) << "Ignoring " << asio::buffer_size(datagram) << " byte datagram from " << sender;
    return false;
  }

  if (sender == echo_endpoint_) {
    if (response.Discriminator() == kEcho) {
      first_remote_ = response.RemoteEndpoint();
      VLOG(1) << "First server sees us at " << *first_remote_;
      return true;
    }
  } else if (sender == receive_only_endpoint_) {
    if (response.Discriminator() == kCrossPort) {
      saw_cross_port_reply_ = true;
      VLOG(1) << "Cross-port reply from " << sender;
      return true;
    }
  } else if (sender == second_echo_endpoint_) {
    if (response.Discriminator() == kCrossServer) {
      second_remote_ = response.RemoteEndpoint();
      VLOG(1) << "Second server sees us at " << *second_remote_;
      return true;
    }
  }

  VLOG(2) << "Ignoring response " << response << " from " << sender;
  return false;
}

RoundResult ProbeRound::Result() const {
  RoundResult result;
  result.first_server = *first_remote_;
  result.second_server = *second_remote_;
  result.cross_port_reply = saw_cross_port_reply_;
  return result;
}

}  // namespace detail

}  // namespace natcheck

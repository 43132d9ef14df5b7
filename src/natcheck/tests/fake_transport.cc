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

#include "natcheck/tests/fake_transport.h"

#include "boost/asio/error.hpp"

#include "natcheck/packets/probe_response.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

namespace test {

FakeTransport::FakeTransport()
    : Transport(),
      inbound_(),
      sent_(),
      fail_send_index_(static_cast<size_t>(-1)),
      send_error_(),
      receive_count_(0) {}

void FakeTransport::AddDatagram(const std::vector<unsigned char>& data, const Endpoint& sender) {
  Inbound inbound;
  inbound.data = data;
  inbound.sender = sender;
  inbound_.push_back(inbound);
}

void FakeTransport::AddResponse(unsigned char discriminator, const Endpoint& observed,
                                const Endpoint& sender) {
  detail::ProbeResponse response;
  response.SetDiscriminator(discriminator);
  response.SetPort(observed.port());
  response.SetRemoteAddress(observed.address().to_v4());
  response.SetLocalAddress(sender.address().to_v4());
  std::vector<unsigned char> data(detail::ProbeResponse::kPacketSize);
  response.Encode(asio::buffer(data));
  AddDatagram(data, sender);
}

void FakeTransport::AddReceiveError(const bs::error_code& ec) {
  Inbound inbound;
  inbound.ec = ec;
  inbound_.push_back(inbound);
}

void FakeTransport::FailSend(size_t send_index, const bs::error_code& ec) {
  fail_send_index_ = send_index;
  send_error_ = ec;
}

Transport::Endpoint FakeTransport::local_endpoint(bs::error_code& ec) const {
  ec.clear();
  return MakeEndpoint("192.168.1.2", 50000);
}

size_t FakeTransport::SendTo(const asio::const_buffer& buffer, const Endpoint& endpoint,
                             bs::error_code& ec) {
  if (sent_.size() == fail_send_index_) {
    ec = send_error_;
    return 0;
  }
  Sent sent;
  const unsigned char* data(asio::buffer_cast<const unsigned char*>(buffer));
  sent.data.assign(data, data + asio::buffer_size(buffer));
  sent.endpoint = endpoint;
  sent_.push_back(sent);
  ec.clear();
  return sent.data.size();
}

size_t FakeTransport::ReceiveFrom(const asio::mutable_buffer& buffer, Endpoint& sender_endpoint,
                                  bs::error_code& ec) {
  ++receive_count_;
  if (inbound_.empty()) {
    ec = asio::error::timed_out;
    return 0;
  }

  Inbound inbound(inbound_.front());
  inbound_.pop_front();
  if (inbound.ec) {
    ec = inbound.ec;
    return 0;
  }

  ec.clear();
  sender_endpoint = inbound.sender;
  return asio::buffer_copy(buffer, asio::buffer(inbound.data));
}

Transport::Endpoint MakeEndpoint(const char* address, uint16_t port) {
  return Transport::Endpoint(ip::address_v4::from_string(address), port);
}

}  // namespace test

}  // namespace natcheck

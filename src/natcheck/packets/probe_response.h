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

#ifndef NATCHECK_PACKETS_PROBE_RESPONSE_H_
#define NATCHECK_PACKETS_PROBE_RESPONSE_H_

#include <array>
#include <cstdint>
#include <ostream>

#include "boost/asio/buffer.hpp"
#include "boost/asio/ip/address_v4.hpp"
#include "boost/asio/ip/udp.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/packets/packet.h"

namespace natcheck {

namespace detail {

// A rendezvous server's report of where a probe appeared to come from.
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                 Payload                       | Discriminator |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |           Reserved            |         Observed Port         |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                       Observed Address                        |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                        Server Address                         |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
class ProbeResponse : public Packet {
 public:
  enum { kPacketSize = 16 };

  ProbeResponse();
  virtual ~ProbeResponse() {}

  const std::array<unsigned char, 4>& Payload() const { return payload_; }
  void SetPayload(const std::array<unsigned char, 4>& payload) { payload_ = payload; }

  // Byte 3 of the payload, identifying which probe this answers.
  unsigned char Discriminator() const { return payload_[3]; }
  void SetDiscriminator(unsigned char discriminator) { payload_[3] = discriminator; }

  uint16_t Port() const { return port_; }
  void SetPort(uint16_t port) { port_ = port; }

  boost::asio::ip::address_v4 RemoteAddress() const { return remote_address_; }
  void SetRemoteAddress(const boost::asio::ip::address_v4& address) { remote_address_ = address; }

  boost::asio::ip::address_v4 LocalAddress() const { return local_address_; }
  void SetLocalAddress(const boost::asio::ip::address_v4& address) { local_address_ = address; }

  // The prober's endpoint as observed by the server.
  boost::asio::ip::udp::endpoint RemoteEndpoint() const;

  static bool IsValid(const boost::asio::const_buffer& buffer);
  // Fails with Error::kInvalidLength unless buffer holds exactly kPacketSize bytes.
  boost::system::error_code Decode(const boost::asio::const_buffer& buffer);
  // Returns the number of bytes written, or 0 if buffer is too small.
  size_t Encode(const boost::asio::mutable_buffer& buffer) const;

 private:
  std::array<unsigned char, 4> payload_;
  uint16_t port_;
  boost::asio::ip::address_v4 remote_address_, local_address_;
};

template <typename Elem, typename Traits>
std::basic_ostream<Elem, Traits>& operator<<(std::basic_ostream<Elem, Traits>& ostream,
                                             const ProbeResponse& response) {
  ostream << static_cast<int>(response.Discriminator()) << ' ' << response.RemoteEndpoint();
  return ostream;
}

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_PACKETS_PROBE_RESPONSE_H_

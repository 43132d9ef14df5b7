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

#include "natcheck/packets/packet.h"

#include <algorithm>

namespace natcheck {

namespace detail {

Packet::~Packet() {}

void Packet::DecodeUint16(uint16_t* n, const unsigned char* p) {
  *n = p[0];
  *n = static_cast<uint16_t>((*n << 8) | p[1]);
}

void Packet::EncodeUint16(uint16_t n, unsigned char* p) {
  p[0] = ((n >> 8) & 0xff);
  p[1] = (n & 0xff);
}

void Packet::DecodeAddress(boost::asio::ip::address_v4* address, const unsigned char* p) {
  boost::asio::ip::address_v4::bytes_type bytes;
  std::copy(p, p + bytes.size(), bytes.begin());
  *address = boost::asio::ip::address_v4(bytes);
}

void Packet::EncodeAddress(const boost::asio::ip::address_v4& address, unsigned char* p) {
  boost::asio::ip::address_v4::bytes_type bytes(address.to_bytes());
  std::copy(bytes.begin(), bytes.end(), p);
}

}  // namespace detail

}  // namespace natcheck

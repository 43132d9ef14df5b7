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

#ifndef NATCHECK_PACKETS_PACKET_H_
#define NATCHECK_PACKETS_PACKET_H_

#include <cstdint>

#include "boost/asio/buffer.hpp"
#include "boost/asio/ip/address_v4.hpp"

namespace natcheck {

namespace detail {

class Packet {
 protected:
  // Prevent deletion through this type.
  virtual ~Packet();

  // Helper functions for encoding and decoding network byte order fields.
  static void DecodeUint16(uint16_t* n, const unsigned char* p);
  static void EncodeUint16(uint16_t n, unsigned char* p);
  static void DecodeAddress(boost::asio::ip::address_v4* address, const unsigned char* p);
  static void EncodeAddress(const boost::asio::ip::address_v4& address, unsigned char* p);
};

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_PACKETS_PACKET_H_

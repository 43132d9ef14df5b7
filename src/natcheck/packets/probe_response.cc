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

#include "natcheck/packets/probe_response.h"

#include <algorithm>

#include "natcheck/error.h"

namespace natcheck {

namespace detail {

ProbeResponse::ProbeResponse() : payload_(), port_(0), remote_address_(), local_address_() {
  payload_.fill(0);
}

boost::asio::ip::udp::endpoint ProbeResponse::RemoteEndpoint() const {
  return boost::asio::ip::udp::endpoint(remote_address_, port_);
}

bool ProbeResponse::IsValid(const boost::asio::const_buffer& buffer) {
  return boost::asio::buffer_size(buffer) == kPacketSize;
}

boost::system::error_code ProbeResponse::Decode(const boost::asio::const_buffer& buffer) {
  if (!IsValid(buffer))
    return make_error_code(Error::kInvalidLength);

  const unsigned char* p = boost::asio::buffer_cast<const unsigned char*>(buffer);
  std::copy(p, p + payload_.size(), payload_.begin());
  // Bytes 4 and 5 are reserved.
  DecodeUint16(&port_, p + 6);
  DecodeAddress(&remote_address_, p + 8);
  DecodeAddress(&local_address_, p + 12);
  return boost::system::error_code();
}

size_t ProbeResponse::Encode(const boost::asio::mutable_buffer& buffer) const {
  if (boost::asio::buffer_size(buffer) < kPacketSize)
    return 0;

  unsigned char* p = boost::asio::buffer_cast<unsigned char*>(buffer);
  std::copy(payload_.begin(), payload_.end(), p);
  p[4] = p[5] = 0;
  EncodeUint16(port_, p + 6);
  EncodeAddress(remote_address_, p + 8);
  EncodeAddress(local_address_, p + 12);
  return kPacketSize;
}

}  // namespace detail

}  // namespace natcheck

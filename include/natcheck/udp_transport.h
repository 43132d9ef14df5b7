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

#ifndef NATCHECK_UDP_TRANSPORT_H_
#define NATCHECK_UDP_TRANSPORT_H_

#include "boost/asio/io_service.hpp"
#include "boost/asio/ip/udp.hpp"

#include "natcheck/transport.h"

namespace natcheck {

// Plain UDP socket with no intermediary.
class UdpTransport : public Transport {
 public:
  explicit UdpTransport(boost::asio::io_service& io_service);
  virtual ~UdpTransport();

  // Opens the socket and binds it to endpoint, which must be IPv4.  Port 0 picks an ephemeral
  // port.
  void Bind(const Endpoint& endpoint, boost::system::error_code& ec);

  bool IsOpen() const;
  void Close();

  virtual Endpoint local_endpoint(boost::system::error_code& ec) const;
  virtual size_t SendTo(const boost::asio::const_buffer& buffer, const Endpoint& endpoint,
                        boost::system::error_code& ec);
  virtual size_t ReceiveFrom(const boost::asio::mutable_buffer& buffer, Endpoint& sender_endpoint,
                             boost::system::error_code& ec);

 private:
  boost::asio::io_service& io_service_;
  boost::asio::ip::udp::socket socket_;
};

}  // namespace natcheck

#endif  // NATCHECK_UDP_TRANSPORT_H_

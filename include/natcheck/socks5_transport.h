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

#ifndef NATCHECK_SOCKS5_TRANSPORT_H_
#define NATCHECK_SOCKS5_TRANSPORT_H_

#include <string>
#include <utility>
#include <vector>

#include "boost/asio/io_service.hpp"
#include "boost/asio/ip/tcp.hpp"
#include "boost/asio/ip/udp.hpp"
#include "boost/optional/optional.hpp"

#include "natcheck/transport.h"

namespace natcheck {

struct Socks5Credentials {
  Socks5Credentials() : username(), password() {}
  Socks5Credentials(std::string username_in, std::string password_in)
      : username(std::move(username_in)), password(std::move(password_in)) {}

  std::string username, password;
};

// UDP datagrams relayed through a SOCKS5 proxy (RFC 1928 UDP ASSOCIATE, with optional RFC 1929
// username/password authentication).  The TCP control connection is held open for the lifetime
// of the transport since the proxy drops the association when it closes.
class Socks5Transport : public Transport {
 public:
  // Size of the relay header prepended to each datagram for an IPv4 destination.
  enum { kIpv4HeaderSize = 10 };

  explicit Socks5Transport(boost::asio::io_service& io_service);
  virtual ~Socks5Transport();

  // Connects to proxy, authenticates if credentials are given, binds a local UDP socket to
  // local and asks the proxy to relay for it.
  void Bind(const boost::asio::ip::tcp::endpoint& proxy, const Endpoint& local,
            const boost::optional<Socks5Credentials>& credentials, boost::system::error_code& ec);

  bool IsOpen() const;
  void Close();

  // Endpoint of the proxy's UDP relay, valid once Bind has succeeded.
  Endpoint relay_endpoint() const { return relay_endpoint_; }

  // Reports the local endpoint of the TCP control connection.
  virtual Endpoint local_endpoint(boost::system::error_code& ec) const;
  virtual size_t SendTo(const boost::asio::const_buffer& buffer, const Endpoint& endpoint,
                        boost::system::error_code& ec);
  virtual size_t ReceiveFrom(const boost::asio::mutable_buffer& buffer, Endpoint& sender_endpoint,
                             boost::system::error_code& ec);

 private:
  void Negotiate(const boost::optional<Socks5Credentials>& credentials,
                 boost::system::error_code& ec);
  void Authenticate(const Socks5Credentials& credentials, boost::system::error_code& ec);
  void Associate(const Endpoint& local, const boost::asio::ip::tcp::endpoint& proxy,
                 boost::system::error_code& ec);

  boost::asio::io_service& io_service_;
  boost::asio::ip::tcp::socket control_socket_;
  boost::asio::ip::udp::socket socket_;
  Endpoint relay_endpoint_;
  std::vector<unsigned char> send_buffer_, receive_buffer_;
};

}  // namespace natcheck

#endif  // NATCHECK_SOCKS5_TRANSPORT_H_

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

#ifndef NATCHECK_TRANSPORT_H_
#define NATCHECK_TRANSPORT_H_

#include <cstddef>

#include "boost/asio/buffer.hpp"
#include "boost/asio/ip/udp.hpp"
#include "boost/optional/optional.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/parameters.h"

namespace natcheck {

// A bound endpoint which can send datagrams to, and receive datagrams from, any IPv4 endpoint.
// Every operation blocks; the read and write timeouts are the only way to bound how long.  An
// operation which runs out of time fails with boost::asio::error::timed_out.
//
// Implementations only ever deal in IPv4 endpoints.  Seeing anything else is a programming error
// and is treated as fatal rather than reported through an error_code.
class Transport {
 public:
  typedef boost::asio::ip::udp::endpoint Endpoint;

  virtual ~Transport();

  virtual Endpoint local_endpoint(boost::system::error_code& ec) const = 0;

  // Sends a single datagram.  Returns the number of payload bytes sent.
  virtual size_t SendTo(const boost::asio::const_buffer& buffer, const Endpoint& endpoint,
                        boost::system::error_code& ec) = 0;

  // Receives a single datagram into buffer, setting sender_endpoint to where it came from.
  // Returns the number of payload bytes received.
  virtual size_t ReceiveFrom(const boost::asio::mutable_buffer& buffer, Endpoint& sender_endpoint,
                             boost::system::error_code& ec) = 0;

  // An empty timeout means block indefinitely.  A zero-length timeout is rejected with
  // boost::asio::error::invalid_argument.
  void set_read_timeout(const boost::optional<Timeout>& timeout, boost::system::error_code& ec);
  void set_write_timeout(const boost::optional<Timeout>& timeout, boost::system::error_code& ec);
  boost::optional<Timeout> read_timeout() const { return read_timeout_; }
  boost::optional<Timeout> write_timeout() const { return write_timeout_; }

 protected:
  Transport();

 private:
  // Disallow copying and assignment.
  Transport(const Transport&);
  Transport& operator=(const Transport&);

  boost::optional<Timeout> read_timeout_, write_timeout_;
};

}  // namespace natcheck

#endif  // NATCHECK_TRANSPORT_H_

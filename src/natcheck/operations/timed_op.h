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

#ifndef NATCHECK_OPERATIONS_TIMED_OP_H_
#define NATCHECK_OPERATIONS_TIMED_OP_H_

#include <cstddef>

#include "boost/asio/deadline_timer.hpp"
#include "boost/asio/error.hpp"
#include "boost/asio/io_service.hpp"
#include "boost/optional/optional.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/parameters.h"

namespace natcheck {

namespace detail {

// Turns an asynchronous socket operation into a blocking one which gives up after timeout.
// initiate is invoked with a completion handler of signature
//   void(const boost::system::error_code&, size_t)
// and must start exactly one asynchronous operation on socket.  The io_service is driven from the
// calling thread until the operation completes.  If the timer fires first the socket's pending
// operations are cancelled and ec is set to boost::asio::error::timed_out.
template <typename Socket, typename Initiate>
size_t RunWithTimeout(boost::asio::io_service& io_service, Socket& socket,
                      const boost::optional<Timeout>& timeout, Initiate initiate,
                      boost::system::error_code& ec) {
  size_t bytes_transferred(0);
  bool timed_out(false);
  ec = boost::asio::error::would_block;
  io_service.reset();
  initiate([&ec, &bytes_transferred](const boost::system::error_code& error, size_t length) {
    ec = error;
    bytes_transferred = length;
  });

  boost::asio::deadline_timer timer(io_service);
  boost::system::error_code timer_ec(boost::asio::error::would_block);
  if (timeout) {
    timer.expires_from_now(*timeout);
    timer.async_wait([&socket, &timed_out, &timer_ec](const boost::system::error_code& error) {
      timer_ec = error;
      if (error != boost::asio::error::operation_aborted) {
        timed_out = true;
        boost::system::error_code ignored_ec;
        socket.cancel(ignored_ec);
      }
    });
  }

  while (ec == boost::asio::error::would_block && io_service.run_one() != 0) {}

  if (timeout) {
    boost::system::error_code ignored_ec;
    timer.cancel(ignored_ec);
    while (timer_ec == boost::asio::error::would_block && io_service.run_one() != 0) {}
  }

  if (timed_out && ec == boost::asio::error::operation_aborted)
    ec = boost::asio::error::timed_out;
  return bytes_transferred;
}

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_OPERATIONS_TIMED_OP_H_

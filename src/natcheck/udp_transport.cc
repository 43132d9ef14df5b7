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

#include "natcheck/udp_transport.h"

#include <functional>

#include "glog/logging.h"

#include "natcheck/operations/timed_op.h"

namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

UdpTransport::UdpTransport(boost::asio::io_service& io_service)
    : Transport(), io_service_(io_service), socket_(io_service) {}

UdpTransport::~UdpTransport() { Close(); }

void UdpTransport::Bind(const Endpoint& endpoint, bs::error_code& ec) {
  CHECK(endpoint.address().is_v4()) << "Only IPv4 endpoints are supported, got " << endpoint;
  if (socket_.is_open()) {
    LOG(WARNING) << "UdpTransport already open.";
    ec = boost::asio::error::already_open;
    return;
  }

  socket_.open(ip::udp::v4(), ec);
  if (ec) {
    LOG(ERROR) << "UdpTransport socket opening error while attempting on " << endpoint
               << "  Error: " << ec.message();
    return;
  }

  socket_.bind(endpoint, ec);
  if (ec) {
    LOG(ERROR) << "UdpTransport socket binding error while attempting on " << endpoint
               << "  Error: " << ec.message();
    bs::error_code ignored_ec;
    socket_.close(ignored_ec);
  }
}

bool UdpTransport::IsOpen() const { return socket_.is_open(); }

void UdpTransport::Close() {
  if (!socket_.is_open())
    return;
  bs::error_code ec;
  socket_.close(ec);
  if (ec)
    LOG(WARNING) << "UdpTransport closing error: " << ec.message();
}

Transport::Endpoint UdpTransport::local_endpoint(bs::error_code& ec) const {
  Endpoint endpoint(socket_.local_endpoint(ec));
  if (ec)
    return Endpoint();
  CHECK(endpoint.address().is_v4()) << "UdpTransport bound to non-IPv4 endpoint " << endpoint;
  return endpoint;
}

size_t UdpTransport::SendTo(const boost::asio::const_buffer& buffer, const Endpoint& endpoint,
                            bs::error_code& ec) {
  CHECK(endpoint.address().is_v4()) << "Only IPv4 endpoints are supported, got " << endpoint;
  return detail::RunWithTimeout(io_service_, socket_, write_timeout(),
      [&](const std::function<void(const bs::error_code&, size_t)>& handler) {
        socket_.async_send_to(boost::asio::buffer(buffer), endpoint, handler);
      }, ec);
}

size_t UdpTransport::ReceiveFrom(const boost::asio::mutable_buffer& buffer,
                                 Endpoint& sender_endpoint, bs::error_code& ec) {
  size_t length = detail::RunWithTimeout(io_service_, socket_, read_timeout(),
      [&](const std::function<void(const bs::error_code&, size_t)>& handler) {
        socket_.async_receive_from(boost::asio::buffer(buffer), sender_endpoint, handler);
      }, ec);
  if (!ec) {
    CHECK(sender_endpoint.address().is_v4()) << "Received from non-IPv4 endpoint "
                                             << sender_endpoint;
  }
  return length;
}

}  // namespace natcheck

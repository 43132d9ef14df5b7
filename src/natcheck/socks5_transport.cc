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

#include "natcheck/socks5_transport.h"

#include <algorithm>
#include <array>
#include <functional>

#include "boost/asio/read.hpp"
#include "boost/asio/write.hpp"
#include "glog/logging.h"

#include "natcheck/error.h"
#include "natcheck/parameters.h"
#include "natcheck/operations/timed_op.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

namespace {

const unsigned char kSocksVersion(0x05);
const unsigned char kAuthenticationVersion(0x01);
const unsigned char kMethodNoAuthentication(0x00);
const unsigned char kMethodUsernamePassword(0x02);
const unsigned char kCommandUdpAssociate(0x03);
const unsigned char kAddressTypeIpv4(0x01);
const unsigned char kAddressTypeDomainName(0x03);
const unsigned char kAddressTypeIpv6(0x04);
const unsigned char kReplySucceeded(0x00);
const size_t kMaxCredentialSize(255);

void EncodeEndpoint(const ip::udp::endpoint& endpoint, unsigned char* p) {
  ip::address_v4::bytes_type bytes(endpoint.address().to_v4().to_bytes());
  std::copy(bytes.begin(), bytes.end(), p);
  p[4] = ((endpoint.port() >> 8) & 0xff);
  p[5] = (endpoint.port() & 0xff);
}

ip::udp::endpoint DecodeEndpoint(const unsigned char* p) {
  ip::address_v4::bytes_type bytes;
  std::copy(p, p + bytes.size(), bytes.begin());
  unsigned short port = p[4];  // NOLINT
  port = ((port << 8) | p[5]);
  return ip::udp::endpoint(ip::address_v4(bytes), port);
}

}  // unnamed namespace

Socks5Transport::Socks5Transport(asio::io_service& io_service)
    : Transport(),
      io_service_(io_service),
      control_socket_(io_service),
      socket_(io_service),
      relay_endpoint_(),
      send_buffer_(),
      receive_buffer_(Parameters::kMaxDatagramSize + kIpv4HeaderSize) {}

Socks5Transport::~Socks5Transport() { Close(); }

void Socks5Transport::Bind(const ip::tcp::endpoint& proxy, const Endpoint& local,
                           const boost::optional<Socks5Credentials>& credentials,
                           bs::error_code& ec) {
  CHECK(proxy.address().is_v4()) << "Only IPv4 proxies are supported, got " << proxy;
  CHECK(local.address().is_v4()) << "Only IPv4 endpoints are supported, got " << local;
  if (IsOpen()) {
    LOG(WARNING) << "Socks5Transport already open.";
    ec = asio::error::already_open;
    return;
  }

  control_socket_.connect(proxy, ec);
  if (ec) {
    LOG(ERROR) << "Failed to connect to SOCKS5 proxy " << proxy << "  Error: " << ec.message();
    Close();
    return;
  }

  Negotiate(credentials, ec);
  if (ec) {
    LOG(ERROR) << "SOCKS5 negotiation with " << proxy << " failed: " << ec.message();
    Close();
    return;
  }

  socket_.open(ip::udp::v4(), ec);
  if (!ec)
    socket_.bind(local, ec);
  if (ec) {
    LOG(ERROR) << "Socks5Transport socket binding error while attempting on " << local
               << "  Error: " << ec.message();
    Close();
    return;
  }

  Endpoint bound_endpoint(socket_.local_endpoint(ec));
  if (!ec)
    Associate(bound_endpoint, proxy, ec);
  if (!ec)
    socket_.connect(relay_endpoint_, ec);
  if (ec) {
    LOG(ERROR) << "SOCKS5 UDP associate via " << proxy << " failed: " << ec.message();
    Close();
    return;
  }

  LOG(INFO) << "SOCKS5 relay " << relay_endpoint_ << " associated for " << bound_endpoint;
}

void Socks5Transport::Negotiate(const boost::optional<Socks5Credentials>& credentials,
                                bs::error_code& ec) {
  std::vector<unsigned char> request;
  if (credentials) {
    if (credentials->username.size() > kMaxCredentialSize ||
        credentials->password.size() > kMaxCredentialSize) {
      ec = asio::error::invalid_argument;
      return;
    }
    request = {kSocksVersion, 2, kMethodNoAuthentication, kMethodUsernamePassword};
  } else {
    request = {kSocksVersion, 1, kMethodNoAuthentication};
  }

  asio::write(control_socket_, asio::buffer(request), ec);
  if (ec)
    return;

  std::array<unsigned char, 2> reply;
  asio::read(control_socket_, asio::buffer(reply), ec);
  if (ec)
    return;

  if (reply[0] != kSocksVersion) {
    ec = Error::kProxyVersionMismatch;
    return;
  }

  if (reply[1] == kMethodNoAuthentication)
    return;
  if (reply[1] == kMethodUsernamePassword && credentials)
    return Authenticate(*credentials, ec);
  ec = Error::kNoAcceptableMethod;
}

void Socks5Transport::Authenticate(const Socks5Credentials& credentials, bs::error_code& ec) {
  std::vector<unsigned char> request;
  request.reserve(3 + credentials.username.size() + credentials.password.size());
  request.push_back(kAuthenticationVersion);
  request.push_back(static_cast<unsigned char>(credentials.username.size()));
  request.insert(request.end(), credentials.username.begin(), credentials.username.end());
  request.push_back(static_cast<unsigned char>(credentials.password.size()));
  request.insert(request.end(), credentials.password.begin(), credentials.password.end());

  asio::write(control_socket_, asio::buffer(request), ec);
  if (ec)
    return;

  std::array<unsigned char, 2> reply;
  asio::read(control_socket_, asio::buffer(reply), ec);
  if (ec)
    return;

  if (reply[0] != kAuthenticationVersion || reply[1] != kReplySucceeded)
    ec = Error::kAuthenticationFailed;
}

void Socks5Transport::Associate(const Endpoint& local, const ip::tcp::endpoint& proxy,
                                bs::error_code& ec) {
  std::array<unsigned char, 4 + 6> request = {
      {kSocksVersion, kCommandUdpAssociate, 0x00, kAddressTypeIpv4}};
  EncodeEndpoint(local, &request[4]);
  asio::write(control_socket_, asio::buffer(request), ec);
  if (ec)
    return;

  // VER, REP, RSV, ATYP
  std::array<unsigned char, 4> reply;
  asio::read(control_socket_, asio::buffer(reply), ec);
  if (ec)
    return;

  if (reply[0] != kSocksVersion) {
    ec = Error::kProxyVersionMismatch;
    return;
  }
  if (reply[1] != kReplySucceeded) {
    LOG(WARNING) << "SOCKS5 proxy refused UDP associate with reply code "
                 << static_cast<int>(reply[1]);
    ec = Error::kProxyCommandFailed;
    return;
  }
  if (reply[3] != kAddressTypeIpv4) {
    ec = Error::kUnsupportedAddressType;
    return;
  }

  std::array<unsigned char, 6> bound_address;
  asio::read(control_socket_, asio::buffer(bound_address), ec);
  if (ec)
    return;

  relay_endpoint_ = DecodeEndpoint(bound_address.data());
  // Proxies commonly answer 0.0.0.0 meaning "the address you connected to".
  if (relay_endpoint_.address().is_unspecified())
    relay_endpoint_.address(proxy.address());
}

bool Socks5Transport::IsOpen() const { return control_socket_.is_open() || socket_.is_open(); }

void Socks5Transport::Close() {
  bs::error_code ec;
  if (socket_.is_open()) {
    socket_.close(ec);
    if (ec)
      LOG(WARNING) << "Socks5Transport closing error: " << ec.message();
  }
  if (control_socket_.is_open()) {
    control_socket_.close(ec);
    if (ec)
      LOG(WARNING) << "Socks5Transport control connection closing error: " << ec.message();
  }
  relay_endpoint_ = Endpoint();
}

Transport::Endpoint Socks5Transport::local_endpoint(bs::error_code& ec) const {
  ip::tcp::endpoint endpoint(control_socket_.local_endpoint(ec));
  if (ec)
    return Endpoint();
  CHECK(endpoint.address().is_v4()) << "SOCKS5 control connection on non-IPv4 endpoint "
                                    << endpoint;
  return Endpoint(endpoint.address(), endpoint.port());
}

size_t Socks5Transport::SendTo(const asio::const_buffer& buffer, const Endpoint& endpoint,
                               bs::error_code& ec) {
  CHECK(endpoint.address().is_v4()) << "Only IPv4 endpoints are supported, got " << endpoint;
  // RSV, RSV, FRAG, ATYP, DST.ADDR, DST.PORT, DATA
  send_buffer_.assign(kIpv4HeaderSize, 0);
  send_buffer_[3] = kAddressTypeIpv4;
  EncodeEndpoint(endpoint, &send_buffer_[4]);
  const unsigned char* data = asio::buffer_cast<const unsigned char*>(buffer);
  send_buffer_.insert(send_buffer_.end(), data, data + asio::buffer_size(buffer));

  size_t sent = detail::RunWithTimeout(io_service_, socket_, write_timeout(),
      [&](const std::function<void(const bs::error_code&, size_t)>& handler) {
        socket_.async_send(asio::buffer(send_buffer_), handler);
      }, ec);
  if (ec || sent < kIpv4HeaderSize)
    return 0;
  return sent - kIpv4HeaderSize;
}

size_t Socks5Transport::ReceiveFrom(const asio::mutable_buffer& buffer, Endpoint& sender_endpoint,
                                    bs::error_code& ec) {
  for (;;) {
    size_t length = detail::RunWithTimeout(io_service_, socket_, read_timeout(),
        [&](const std::function<void(const bs::error_code&, size_t)>& handler) {
          socket_.async_receive(asio::buffer(receive_buffer_), handler);
        }, ec);
    if (ec)
      return 0;

    // Fragments are never reassembled; a datagram too short to hold a header is noise.
    if (length < kIpv4HeaderSize || receive_buffer_[2] != 0) {
      VLOG(1) << "Dropping malformed or fragmented relay datagram of " << length << " bytes";
      continue;
    }

    const unsigned char address_type(receive_buffer_[3]);
    CHECK(address_type != kAddressTypeDomainName && address_type != kAddressTypeIpv6)
        << "SOCKS5 relay reported a non-IPv4 source address (type "
        << static_cast<int>(address_type) << ")";
    if (address_type != kAddressTypeIpv4) {
      VLOG(1) << "Dropping relay datagram with unknown address type "
              << static_cast<int>(address_type);
      continue;
    }

    sender_endpoint = DecodeEndpoint(&receive_buffer_[4]);
    return asio::buffer_copy(buffer, asio::buffer(&receive_buffer_[kIpv4HeaderSize],
                                                  length - kIpv4HeaderSize));
  }
}

}  // namespace natcheck

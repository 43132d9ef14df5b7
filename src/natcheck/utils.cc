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

#include "natcheck/utils.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include "boost/asio/error.hpp"
#include "boost/asio/ip/udp.hpp"
#include "glog/logging.h"

#include "natcheck/error.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;
namespace bs = boost::system;

namespace natcheck {

ip::address_v4 ResolveIpv4(asio::io_service& io_service, const std::string& host,
                           bs::error_code& ec) {
  ip::udp::resolver resolver(io_service);
  ip::udp::resolver::query query(ip::udp::v4(), host, "0",
                                 ip::udp::resolver::query::numeric_service);
  ip::udp::resolver::iterator itr(resolver.resolve(query, ec)), end;
  if (ec) {
    LOG(ERROR) << "Failed to resolve " << host << ": " << ec.message();
    return ip::address_v4();
  }

  for (; itr != end; ++itr) {
    ip::address address(itr->endpoint().address());
    if (address.is_v4())
      return address.to_v4();
  }

  LOG(ERROR) << "No IPv4 address found for " << host;
  ec = Error::kNoIpv4Address;
  return ip::address_v4();
}

ip::tcp::endpoint ResolveProxyEndpoint(asio::io_service& io_service, const std::string& address,
                                       bs::error_code& ec) {
  std::string::size_type colon(address.rfind(':'));
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    LOG(ERROR) << "Expected host:port, got \"" << address << '"';
    ec = asio::error::invalid_argument;
    return ip::tcp::endpoint();
  }

  const std::string port_str(address.substr(colon + 1));
  char* end(nullptr);
  long port(std::strtol(port_str.c_str(), &end, 10));  // NOLINT
  if (*end != '\0' || port <= 0 || port > 65535) {
    LOG(ERROR) << "Invalid port in \"" << address << '"';
    ec = asio::error::invalid_argument;
    return ip::tcp::endpoint();
  }

  ip::address_v4 host(ResolveIpv4(io_service, address.substr(0, colon), ec));
  if (ec)
    return ip::tcp::endpoint();
  return ip::tcp::endpoint(host, static_cast<unsigned short>(port));  // NOLINT
}

boost::optional<Timeout> ParseTimeout(const std::string& milliseconds, bs::error_code& ec) {
  if (milliseconds.empty() ||
      milliseconds.find_first_not_of("0123456789") != std::string::npos) {
    LOG(ERROR) << "Invalid timeout \"" << milliseconds << "\", expected milliseconds";
    ec = asio::error::invalid_argument;
    return boost::none;
  }

  const unsigned long long kMaxMilliseconds(  // NOLINT
      static_cast<unsigned long long>(std::numeric_limits<int64_t>::max() / 1000));  // NOLINT
  errno = 0;
  unsigned long long value(std::strtoull(milliseconds.c_str(), nullptr, 10));  // NOLINT
  if (errno == ERANGE || value > kMaxMilliseconds) {
    LOG(ERROR) << "Timeout of " << milliseconds << " ms is out of range";
    ec = asio::error::invalid_argument;
    return boost::none;
  }

  ec.clear();
  if (value == 0)
    return boost::none;
  return Timeout(boost::posix_time::milliseconds(static_cast<int64_t>(value)));
}

}  // namespace natcheck

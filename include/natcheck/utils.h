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

#ifndef NATCHECK_UTILS_H_
#define NATCHECK_UTILS_H_

#include <string>

#include "boost/asio/io_service.hpp"
#include "boost/asio/ip/address_v4.hpp"
#include "boost/asio/ip/tcp.hpp"
#include "boost/optional/optional.hpp"
#include "boost/system/error_code.hpp"

#include "natcheck/parameters.h"

namespace natcheck {

// Resolves host, which may be a name or a dotted-quad, to its first IPv4 address.  Fails with
// Error::kNoIpv4Address if the name resolves only to other address families.
boost::asio::ip::address_v4 ResolveIpv4(boost::asio::io_service& io_service,
                                        const std::string& host, boost::system::error_code& ec);

// Parses "host:port" and resolves host with ResolveIpv4.  A missing or out of range port fails
// with boost::asio::error::invalid_argument.
boost::asio::ip::tcp::endpoint ResolveProxyEndpoint(boost::asio::io_service& io_service,
                                                    const std::string& address,
                                                    boost::system::error_code& ec);

// Parses a receive timeout given as a whole number of milliseconds.  "0" means no timeout and
// yields an empty optional.  Anything other than plain decimal digits, including a sign, or a
// value too large for a time_duration fails with boost::asio::error::invalid_argument.
boost::optional<Timeout> ParseTimeout(const std::string& milliseconds,
                                      boost::system::error_code& ec);

}  // namespace natcheck

#endif  // NATCHECK_UTILS_H_

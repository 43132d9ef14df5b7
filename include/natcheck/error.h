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

#ifndef NATCHECK_ERROR_H_
#define NATCHECK_ERROR_H_

#include <string>
#include <type_traits>

#include "boost/system/error_code.hpp"

namespace natcheck {

enum class Error {
  // A probe response was not exactly ProbeResponse::kPacketSize bytes.
  kInvalidLength = 1,
  // The proxy replied with something other than SOCKS version 5.
  kProxyVersionMismatch,
  // The proxy accepted none of the offered authentication methods.
  kNoAcceptableMethod,
  // Username/password sub-negotiation was refused.
  kAuthenticationFailed,
  // UDP ASSOCIATE was answered with a non-zero reply code.
  kProxyCommandFailed,
  // The proxy reported a relay address which isn't IPv4.
  kUnsupportedAddressType,
  // Hostname resolution produced no IPv4 address.
  kNoIpv4Address
};

const boost::system::error_category& GetErrorCategory();

inline boost::system::error_code make_error_code(Error error) {
  return boost::system::error_code(static_cast<int>(error), GetErrorCategory());
}

}  // namespace natcheck

namespace boost {

namespace system {

template <>
struct is_error_code_enum<natcheck::Error> : public std::true_type {};

}  // namespace system

}  // namespace boost

#endif  // NATCHECK_ERROR_H_

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

#include "natcheck/error.h"

namespace natcheck {

namespace {

class ErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "natcheck"; }

  std::string message(int ev) const override {
    switch (static_cast<Error>(ev)) {
      case Error::kInvalidLength:
        return "Invalid probe response length";
      case Error::kProxyVersionMismatch:
        return "Proxy is not a SOCKS5 server";
      case Error::kNoAcceptableMethod:
        return "No acceptable SOCKS5 authentication method";
      case Error::kAuthenticationFailed:
        return "SOCKS5 authentication failed";
      case Error::kProxyCommandFailed:
        return "SOCKS5 UDP associate request failed";
      case Error::kUnsupportedAddressType:
        return "Unsupported SOCKS5 address type";
      case Error::kNoIpv4Address:
        return "No IPv4 address found for host";
      default:
        return "Unknown natcheck error";
    }
  }
};

}  // unnamed namespace

const boost::system::error_category& GetErrorCategory() {
  static ErrorCategory instance;
  return instance;
}

}  // namespace natcheck

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

#include "natcheck/transport.h"

#include "boost/asio/error.hpp"

namespace natcheck {

namespace {

bool IsValidTimeout(const boost::optional<Timeout>& timeout) {
  return !timeout || (!timeout->is_special() && timeout->total_microseconds() > 0);
}

}  // unnamed namespace

Transport::Transport() : read_timeout_(), write_timeout_() {}

Transport::~Transport() {}

void Transport::set_read_timeout(const boost::optional<Timeout>& timeout,
                                 boost::system::error_code& ec) {
  if (!IsValidTimeout(timeout)) {
    ec = boost::asio::error::invalid_argument;
    return;
  }
  read_timeout_ = timeout;
  ec.clear();
}

void Transport::set_write_timeout(const boost::optional<Timeout>& timeout,
                                  boost::system::error_code& ec) {
  if (!IsValidTimeout(timeout)) {
    ec = boost::asio::error::invalid_argument;
    return;
  }
  write_timeout_ = timeout;
  ec.clear();
}

}  // namespace natcheck

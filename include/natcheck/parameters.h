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

#ifndef NATCHECK_PARAMETERS_H_
#define NATCHECK_PARAMETERS_H_

#include <cstdint>

#include "boost/date_time/posix_time/posix_time_duration.hpp"

namespace natcheck {

typedef boost::posix_time::time_duration Timeout;

// This class provides the configurability to all probing related parameters.
struct Parameters {
 public:
  // Time to wait for each response when the caller doesn't choose one.
  static Timeout default_receive_timeout;

  // Number of times each probe payload is sent in a round.  UDP gives no delivery guarantee and
  // the rendezvous servers don't acknowledge, so probes are simply repeated.
  static uint32_t probe_send_count;

  // Largest datagram accepted by a receive.  Shall not be less than the UDP payload, which is
  // 65507, plus a SOCKS5 relay header.
  enum {
    kMaxDatagramSize = 65535
  };

 private:
  // Disallow copying and assignment.
  Parameters(const Parameters&);
  Parameters& operator=(const Parameters&);
};

}  // namespace natcheck

#endif  // NATCHECK_PARAMETERS_H_

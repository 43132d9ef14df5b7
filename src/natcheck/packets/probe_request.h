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

#ifndef NATCHECK_PACKETS_PROBE_REQUEST_H_
#define NATCHECK_PACKETS_PROBE_REQUEST_H_

#include <array>
#include <cstdint>

namespace natcheck {

namespace detail {

// Rendezvous server ports.  Nothing is ever heard back from kSendOnlyPort, replies to probes sent
// to kEchoPort come from kEchoPort, and kReceiveOnlyPort only ever sends.
enum ProbePort : uint16_t {
  kSendOnlyPort = 33334,
  kEchoPort = 10025,
  kReceiveOnlyPort = 50920
};

// Byte 3 of a probe payload, echoed back in byte 3 of the response it provokes.
enum ProbeKind : unsigned char {
  kSendOnly = 0x00,
  kEcho = 0x65,
  kCrossPort = 0x66,
  kCrossServer = 0x67
};

typedef std::array<unsigned char, 16> ProbePayload;

// Opens a mapping towards the first server without asking for anything back.
extern const ProbePayload kSendOnlyPayload;
// Asks the first server to report the observed endpoint from the port it was sent to.
extern const ProbePayload kEchoPayload;
// Asks the first server to report the observed endpoint from kReceiveOnlyPort.
extern const ProbePayload kCrossPortPayload;
// Asks the second server to report the observed endpoint.
extern const ProbePayload kCrossServerPayload;

}  // namespace detail

}  // namespace natcheck

#endif  // NATCHECK_PACKETS_PROBE_REQUEST_H_

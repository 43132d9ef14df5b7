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

#include "natcheck/nat_type.h"

namespace natcheck {

std::string NintendoLabel(NatType nat_type) {
  switch (nat_type) {
    case NatType::kA:
      return "A";
    case NatType::kB:
      return "B";
    case NatType::kC:
      return "C";
    case NatType::kD:
      return "D";
    case NatType::kF:
      return "F";
    default:
      return "Invalid NAT type";
  }
}

std::string SonyLabel(NatType nat_type) {
  switch (nat_type) {
    case NatType::kA:
      return "1";
    case NatType::kB:
      return "2";
    case NatType::kC:
    case NatType::kD:
      return "3";
    case NatType::kF:
      return "-";
    default:
      return "Invalid NAT type";
  }
}

std::string MicrosoftLabel(NatType nat_type) {
  switch (nat_type) {
    case NatType::kA:
      return "Open";
    case NatType::kB:
      return "Moderate";
    case NatType::kC:
    case NatType::kD:
      return "Strict";
    case NatType::kF:
      return "Unavailable";
    default:
      return "Invalid NAT type";
  }
}

}  // namespace natcheck

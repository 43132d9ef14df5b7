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

#ifndef NATCHECK_NAT_TYPE_H_
#define NATCHECK_NAT_TYPE_H_

#include <ostream>
#include <string>

namespace natcheck {

// Ordered from most to least reachable.  kF means the test couldn't complete.
enum class NatType { kA, kB, kC, kD, kF };

// Nintendo Switch label: the class letter itself.
std::string NintendoLabel(NatType nat_type);

// Sony PlayStation label: "1", "2", "3" or "-".
std::string SonyLabel(NatType nat_type);

// Microsoft Xbox label: "Open", "Moderate", "Strict" or "Unavailable".
std::string MicrosoftLabel(NatType nat_type);

template <typename Elem, typename Traits>
std::basic_ostream<Elem, Traits>& operator<<(std::basic_ostream<Elem, Traits>& ostream,
                                             const NatType& nat_type) {
  std::string nat_str(NintendoLabel(nat_type));
  for (auto& ch : nat_str)
    ostream << ostream.widen(ch);
  return ostream;
}

}  // namespace natcheck

#endif  // NATCHECK_NAT_TYPE_H_

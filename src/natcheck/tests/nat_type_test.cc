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

#include <sstream>

#include "gtest/gtest.h"

#include "natcheck/nat_type.h"

namespace natcheck {

namespace test {

TEST(NatTypeTest, BEH_Labels) {
  EXPECT_EQ("A", NintendoLabel(NatType::kA));
  EXPECT_EQ("B", NintendoLabel(NatType::kB));
  EXPECT_EQ("C", NintendoLabel(NatType::kC));
  EXPECT_EQ("D", NintendoLabel(NatType::kD));
  EXPECT_EQ("F", NintendoLabel(NatType::kF));

  EXPECT_EQ("1", SonyLabel(NatType::kA));
  EXPECT_EQ("2", SonyLabel(NatType::kB));
  EXPECT_EQ("3", SonyLabel(NatType::kC));
  EXPECT_EQ("3", SonyLabel(NatType::kD));
  EXPECT_EQ("-", SonyLabel(NatType::kF));

  EXPECT_EQ("Open", MicrosoftLabel(NatType::kA));
  EXPECT_EQ("Moderate", MicrosoftLabel(NatType::kB));
  EXPECT_EQ("Strict", MicrosoftLabel(NatType::kC));
  EXPECT_EQ("Strict", MicrosoftLabel(NatType::kD));
  EXPECT_EQ("Unavailable", MicrosoftLabel(NatType::kF));
}

TEST(NatTypeTest, BEH_StreamsClassLetter) {
  std::ostringstream stream;
  stream << NatType::kA << NatType::kD << NatType::kF;
  EXPECT_EQ("ADF", stream.str());

  std::wostringstream wide_stream;
  wide_stream << NatType::kC;
  EXPECT_EQ(L"C", wide_stream.str());
}

TEST(NatTypeTest, BEH_Ordering) {
  EXPECT_LT(NatType::kA, NatType::kB);
  EXPECT_LT(NatType::kB, NatType::kC);
  EXPECT_LT(NatType::kC, NatType::kD);
  EXPECT_LT(NatType::kD, NatType::kF);
}

}  // namespace test

}  // namespace natcheck

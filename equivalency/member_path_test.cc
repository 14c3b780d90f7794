// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
#include "equivalency/member_path.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "equivalency/test_utils.h"
#include "equivalency/type.h"

namespace equivalency {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(MemberPathTest, Segments) {
  EXPECT_THAT(MemberPath("Parent.Child[2].Name").segments(),
              ElementsAre("Parent", "Child", "[2]", "Name"));
  EXPECT_THAT(MemberPath("Tables[Orders].Rows[0][Total]").segments(),
              ElementsAre("Tables", "[Orders]", "Rows", "[0]", "[Total]"));
  EXPECT_THAT(MemberPath("").segments(), IsEmpty());
}

TEST(MemberPathTest, KeysWithDots) {
  EXPECT_THAT(MemberPath("Tables[dbo.Orders].Locale").segments(),
              ElementsAre("Tables", "[dbo.Orders]", "Locale"));
  EXPECT_THAT(MemberPath("Rows[0][unit.price]").segments(),
              ElementsAre("Rows", "[0]", "[unit.price]"));
  EXPECT_TRUE(MemberPath("Tables[dbo.Orders].Locale")
                  .IsSameAs(MemberPath("Tables[].Locale")));
  EXPECT_TRUE(MemberPath("Tables[dbo.Orders]")
                  .IsParentOf(MemberPath("Tables[dbo.Orders].Locale")));
}

TEST(MemberPathTest, Normalization) {
  MemberPath path("Items.[2].Name");
  EXPECT_EQ(path.path(), "Items[2].Name");
  EXPECT_EQ(path, MemberPath("Items[2].Name"));
}

TEST(MemberPathTest, EqualityUsesDeclaringType) {
  MemberPath a(test::CustomerType(), test::CustomerType(), "Name");
  MemberPath b(ObjectType(), test::CustomerType(), "Name");
  MemberPath c(test::CustomerType(), test::AddressType(), "Name");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);

  absl::flat_hash_set<MemberPath> paths = {a, b, c};
  EXPECT_EQ(paths.size(), 2);
}

TEST(MemberPathTest, IsSameAs) {
  EXPECT_TRUE(MemberPath("A.B").IsSameAs(MemberPath("A.B")));
  EXPECT_FALSE(MemberPath("A.B").IsSameAs(MemberPath("A")));
  EXPECT_FALSE(MemberPath("A.B").IsSameAs(MemberPath("A.C")));
  // Declaring types do not matter for location comparisons.
  EXPECT_TRUE(MemberPath(test::CustomerType(), test::AddressType(), "A.B")
                  .IsSameAs(MemberPath("A.B")));
}

TEST(MemberPathTest, AnyIndex) {
  EXPECT_TRUE(MemberPath("Items[].Name").IsSameAs(MemberPath("Items[3].Name")));
  EXPECT_TRUE(MemberPath("Items[3].Name").IsSameAs(MemberPath("Items[].Name")));
  EXPECT_FALSE(
      MemberPath("Items[1].Name").IsSameAs(MemberPath("Items[3].Name")));
  EXPECT_FALSE(MemberPath("Items[].Name").IsSameAs(MemberPath("Items.Name")));
}

TEST(MemberPathTest, ParentAndChild) {
  MemberPath parent("Customer.Address");
  MemberPath child("Customer.Address.City");
  EXPECT_TRUE(parent.IsParentOf(child));
  EXPECT_FALSE(child.IsParentOf(parent));
  EXPECT_TRUE(child.IsChildOf(parent));
  EXPECT_FALSE(parent.IsChildOf(child));
  EXPECT_TRUE(parent.IsParentOrChildOf(child));
  EXPECT_TRUE(child.IsParentOrChildOf(parent));
  EXPECT_FALSE(parent.IsParentOf(parent));
  EXPECT_FALSE(MemberPath("Customer.Addresses")
                   .IsParentOrChildOf(MemberPath("Customer.Address.City")));
}

TEST(MemberPathTest, Child) {
  EXPECT_EQ(MemberPath("").Child("Name").path(), "Name");
  EXPECT_EQ(MemberPath("Items[2]").Child("Name").path(), "Items[2].Name");
}

TEST(MemberPathTest, Join) {
  EXPECT_EQ(JoinMemberPath("", "Name"), "Name");
  EXPECT_EQ(JoinMemberPath("Parent", "Name"), "Parent.Name");
  EXPECT_EQ(JoinItemPath("Tables", "Orders"), "Tables[Orders]");
  EXPECT_EQ(JoinItemPath("", "0"), "[0]");
}

TEST(MemberPathTest, Stringify) {
  EXPECT_EQ(absl::StrCat(MemberPath("A.[1]")), "A[1]");
}

}  // namespace
}  // namespace equivalency

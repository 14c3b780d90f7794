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
#include "equivalency/type.h"

#include <memory>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/base/no_destructor.h"
#include "equivalency/record.h"
#include "equivalency/test_utils.h"
#include "equivalency/value.h"

namespace equivalency {
namespace {

using ::testing::ElementsAre;
using ::testing::Property;

const Type& VipCustomerType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("VipCustomer")
          .WithBase(test::CustomerType())
          .AddField("Level", Int64Type())
          .Build());
  return **type;
}

TEST(TypeTest, Builtins) {
  EXPECT_EQ(NullType().kind(), TypeKind::kNull);
  EXPECT_EQ(StringType().name(), "string");
  EXPECT_TRUE(Int64Type().is_primitive());
  EXPECT_FALSE(ObjectType().is_primitive());
  EXPECT_EQ(ListType().base(), &ObjectType());
  EXPECT_EQ(DictType().base(), &ObjectType());
}

TEST(TypeTest, ListOfIsInterned) {
  const Type& strings = ListOf(StringType());
  EXPECT_EQ(&strings, &ListOf(StringType()));
  EXPECT_NE(&strings, &ListOf(Int64Type()));
  EXPECT_EQ(strings.name(), "List<string>");
  EXPECT_EQ(strings.kind(), TypeKind::kList);
  EXPECT_EQ(strings.element_type(), &StringType());
  EXPECT_TRUE(ListType().IsAssignableFrom(strings));
}

TEST(TypeTest, DictOfIsInterned) {
  const Type& dict = DictOf(StringType(), Int64Type());
  EXPECT_EQ(&dict, &DictOf(StringType(), Int64Type()));
  EXPECT_EQ(dict.name(), "Dict<string, int64>");
  EXPECT_EQ(dict.key_type(), &StringType());
  EXPECT_EQ(dict.element_type(), &Int64Type());
}

TEST(TypeTest, Members) {
  const Type& customer = test::CustomerType();
  EXPECT_EQ(customer.kind(), TypeKind::kObject);
  EXPECT_EQ(customer.base(), &ObjectType());
  EXPECT_THAT(customer.GetMembers(),
              ElementsAre(Property(&Member::name, "Name"),
                          Property(&Member::name, "Age"),
                          Property(&Member::name, "Address"),
                          Property(&Member::name, "Tags"),
                          Property(&Member::name, "Attributes")));
  const Member* address = customer.FindMember("Address");
  ASSERT_NE(address, nullptr);
  EXPECT_EQ(&address->declaring_type(), &customer);
  EXPECT_EQ(&address->value_type(), &test::AddressType());
  EXPECT_TRUE(address->is_field());
  EXPECT_EQ(customer.FindMember("Missing"), nullptr);
}

TEST(TypeTest, Inheritance) {
  const Type& vip = VipCustomerType();
  EXPECT_TRUE(test::CustomerType().IsAssignableFrom(vip));
  EXPECT_FALSE(vip.IsAssignableFrom(test::CustomerType()));
  EXPECT_TRUE(ObjectType().IsAssignableFrom(vip));
  EXPECT_TRUE(ObjectType().IsAssignableFrom(Int64Type()));
  EXPECT_FALSE(StringType().IsAssignableFrom(Int64Type()));

  std::vector<const Member*> members = vip.GetMembers();
  ASSERT_EQ(members.size(), 6);
  EXPECT_EQ(members.front()->name(), "Name");
  EXPECT_EQ(members.back()->name(), "Level");

  const Member* name = vip.FindMember("Name");
  ASSERT_NE(name, nullptr);
  EXPECT_EQ(&name->declaring_type(), &test::CustomerType());
}

TEST(MemberTest, GetValue) {
  auto customer = test::MakeCustomer(
      "Ada", 36, test::MakeAddress("Main St", "Springfield"));
  const Member& name = *test::CustomerType().FindMember("Name");
  EXPECT_EQ(name.GetValue(Value(customer)), Value("Ada"));
  // Values of other types have no such member.
  EXPECT_EQ(name.GetValue(Value(test::MakeAddress("a", "b"))), Value());
  EXPECT_EQ(name.GetValue(Value(1)), Value());
  EXPECT_EQ(name.GetValue(Value()), Value());

  auto vip = Record::Create(VipCustomerType());
  vip->Set("Name", Value("Grace"));
  EXPECT_EQ(name.GetValue(Value(vip)), Value("Grace"));
}

TEST(TypeDeathTest, DuplicateMember) {
  EXPECT_DEATH(Type::Builder("Broken")
                   .AddField("A", Int64Type())
                   .AddField("A", StringType())
                   .Build(),
               "declares member A twice");
}

}  // namespace
}  // namespace equivalency

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
#include "equivalency/selection_rules.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/string_view.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/member_path.h"
#include "equivalency/test_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"

namespace equivalency {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pointee;
using ::testing::Property;

auto MemberNamed(absl::string_view name) {
  return Pointee(Property(&Member::name, name));
}

std::vector<const Member*> AllMembers(const Type& type) {
  return type.GetMembers();
}

TEST(AllMembersSelectionRuleTest, SelectsMembersOfExpectationType) {
  EquivalencyOptions options;
  AllMembersSelectionRule rule;
  EXPECT_THAT(rule.SelectMembers(Node(), {},
                                 {.compile_time_type = test::AddressType(),
                                  .runtime_type = test::AddressType(),
                                  .options = options}),
              ElementsAre(MemberNamed("Street"), MemberNamed("City")));

  // Members selected by earlier rules are kept once.
  const Member* city = test::AddressType().FindMember("City");
  EXPECT_THAT(rule.SelectMembers(Node(), {city},
                                 {.compile_time_type = ObjectType(),
                                  .runtime_type = test::AddressType(),
                                  .options = options}),
              ElementsAre(MemberNamed("City"), MemberNamed("Street")));
  EXPECT_EQ(rule.ToString(), "Include all members");
  EXPECT_TRUE(rule.IncludesMembers());
}

TEST(ExcludeMemberByPathSelectionRuleTest, MatchesFullPath) {
  EquivalencyOptions options;
  const MemberSelectionContext context{
      .compile_time_type = test::AddressType(),
      .runtime_type = test::AddressType(),
      .options = options};
  ExcludeMemberByPathSelectionRule rule(MemberPath("Address.City"));
  EXPECT_THAT(rule.SelectMembers(Node().ChildMember("Address"),
                                 AllMembers(test::AddressType()), context),
              ElementsAre(MemberNamed("Street")));
  // Same member name at another location.
  EXPECT_THAT(rule.SelectMembers(Node().ChildMember("Home"),
                                 AllMembers(test::AddressType()), context),
              ElementsAre(MemberNamed("Street"), MemberNamed("City")));
  EXPECT_EQ(rule.ToString(), "Exclude member Address.City");
  EXPECT_FALSE(rule.IncludesMembers());
}

TEST(ExcludeMemberByPathSelectionRuleTest, AnyIndex) {
  EquivalencyOptions options;
  ExcludeMemberByPathSelectionRule rule(MemberPath("[].City"));
  EXPECT_THAT(rule.SelectMembers(Node().ChildItem("3"),
                                 AllMembers(test::AddressType()),
                                 {.compile_time_type = test::AddressType(),
                                  .runtime_type = test::AddressType(),
                                  .options = options}),
              ElementsAre(MemberNamed("Street")));
}

TEST(IncludeMemberByPathSelectionRuleTest, SelectsParentsAndChildren) {
  EquivalencyOptions options;
  IncludeMemberByPathSelectionRule rule(MemberPath("Address.City"));
  EXPECT_THAT(rule.SelectMembers(Node(), {},
                                 {.compile_time_type = test::CustomerType(),
                                  .runtime_type = test::CustomerType(),
                                  .options = options}),
              ElementsAre(MemberNamed("Address")));
  EXPECT_THAT(rule.SelectMembers(Node().ChildMember("Address"), {},
                                 {.compile_time_type = test::AddressType(),
                                  .runtime_type = test::AddressType(),
                                  .options = options}),
              ElementsAre(MemberNamed("City")));

  IncludeMemberByPathSelectionRule whole_address(MemberPath("Address"));
  EXPECT_THAT(
      whole_address.SelectMembers(Node().ChildMember("Address"), {},
                                  {.compile_time_type = test::AddressType(),
                                   .runtime_type = test::AddressType(),
                                   .options = options}),
      ElementsAre(MemberNamed("Street"), MemberNamed("City")));
  EXPECT_EQ(rule.ToString(), "Include member Address.City");
}

TEST(ExcludeMemberByPredicateSelectionRuleTest, ReceivesFullPath) {
  EquivalencyOptions options;
  std::vector<std::string> paths;
  ExcludeMemberByPredicateSelectionRule rule(
      [&paths](const Member& member, absl::string_view path) {
        paths.emplace_back(path);
        return member.value_type().is_primitive();
      },
      "member is primitive");
  EXPECT_THAT(rule.SelectMembers(Node().ChildMember("Address"),
                                 AllMembers(test::AddressType()),
                                 {.compile_time_type = test::AddressType(),
                                  .runtime_type = test::AddressType(),
                                  .options = options}),
              IsEmpty());
  EXPECT_THAT(paths, ElementsAre("Address.Street", "Address.City"));
  EXPECT_EQ(rule.ToString(), "Exclude members where member is primitive");
}

TEST(SelectionRulesTest, DeclaredAndRuntimeTypes) {
  EquivalencyOptions options;
  AllMembersSelectionRule rule;
  // Declared type wins unless runtime types are respected.
  const MemberSelectionContext context{
      .compile_time_type = test::AddressType(),
      .runtime_type = test::CustomerType(),
      .options = options};
  EXPECT_THAT(rule.SelectMembers(Node(), {}, context),
              ElementsAre(MemberNamed("Street"), MemberNamed("City")));
  options.RespectingRuntimeTypes();
  EXPECT_EQ(rule.SelectMembers(Node(), {}, context).size(), 5);
}

}  // namespace
}  // namespace equivalency

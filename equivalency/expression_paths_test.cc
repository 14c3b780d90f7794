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
#include "equivalency/expression_paths.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/strings/string_view.h"
#include "equivalency/member_expression.h"
#include "equivalency/member_path.h"
#include "equivalency/test_utils.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {
namespace {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

MATCHER_P(HasPath, path, "") { return arg.path() == path; }

ExpressionPtr Parse(absl::string_view text) {
  auto expression = ParseMemberExpression(test::CustomerType(), text);
  CHECK_OK(expression.status());
  return *expression;
}

TEST(GetMemberPathTest, SingleMember) {
  ASSERT_OK_AND_ASSIGN(MemberPath path, GetMemberPath(Parse("x => x.Name")));
  EXPECT_EQ(path.path(), "Name");
  EXPECT_EQ(&path.reflected_type(), &test::CustomerType());
  EXPECT_EQ(&path.declaring_type(), &test::CustomerType());
}

TEST(GetMemberPathTest, NestedMember) {
  ASSERT_OK_AND_ASSIGN(MemberPath path,
                       GetMemberPath(Parse("x => x.Address.City")));
  EXPECT_EQ(path.path(), "Address.City");
  EXPECT_EQ(&path.reflected_type(), &test::CustomerType());
  // The last accessed member is declared by Address.
  EXPECT_EQ(&path.declaring_type(), &test::AddressType());
}

TEST(GetMemberPathTest, BarePath) {
  ASSERT_OK_AND_ASSIGN(MemberPath path, GetMemberPath(Parse("Address.City")));
  EXPECT_EQ(path.path(), "Address.City");
}

TEST(GetMemberPathTest, ConstantArrayIndex) {
  ASSERT_OK_AND_ASSIGN(MemberPath path, GetMemberPath(Parse("x => x.Tags[2]")));
  EXPECT_EQ(path.path(), "Tags[2]");
  EXPECT_THAT(path.segments(), ElementsAre("Tags", "[2]"));
}

TEST(GetMemberPathTest, IndexerWithConstantKey) {
  ASSERT_OK_AND_ASSIGN(MemberPath path,
                       GetMemberPath(Parse("x => x.Attributes[\"color\"]")));
  EXPECT_EQ(path.path(), "Attributes[color]");
}

TEST(GetMemberPathTest, Identity) {
  ASSERT_OK_AND_ASSIGN(MemberPath path, GetMemberPath(Parse("x => x")));
  EXPECT_EQ(path.path(), "");
  EXPECT_TRUE(path.empty());
  EXPECT_EQ(&path.declaring_type(), &test::CustomerType());
}

TEST(GetMemberPathTest, ConversionsAreUnwrapped) {
  ExpressionPtr x = expr::Parameter(test::CustomerType());
  ASSERT_OK_AND_ASSIGN(ExpressionPtr age, expr::MemberAccess(x, "Age"));
  EXPECT_THAT(
      GetMemberPath(expr::Lambda(expr::Convert(age, ObjectType()), x)),
      IsOkAndHolds(HasPath("Age")));
  EXPECT_THAT(
      GetMemberPath(expr::Lambda(expr::ConvertChecked(age, DoubleType()), x)),
      IsOkAndHolds(HasPath("Age")));
}

TEST(GetMemberPathsTest, AnonymousObject) {
  ASSERT_OK_AND_ASSIGN(
      std::vector<MemberPath> paths,
      GetMemberPaths(Parse("x => new(x.Name, x.Address.City)")));
  EXPECT_THAT(paths, ElementsAre(HasPath("Name"), HasPath("Address.City")));
  for (const MemberPath& path : paths) {
    EXPECT_EQ(&path.declaring_type(), &test::CustomerType());
  }
}

TEST(GetMemberPathsTest, NewUsesTheSamePathsAsSingleSelectors) {
  ASSERT_OK_AND_ASSIGN(
      std::vector<MemberPath> paths,
      GetMemberPaths(Parse(
          "x => new(x.Attributes[\"color\"], x.Tags[1], x.Address.City)")));
  EXPECT_THAT(paths, ElementsAre(HasPath("Attributes[color]"),
                                 HasPath("Tags[1]"), HasPath("Address.City")));
  ASSERT_OK_AND_ASSIGN(MemberPath single,
                       GetMemberPath(Parse("x => x.Attributes[\"color\"]")));
  EXPECT_EQ(paths[0].path(), single.path());
}

TEST(GetMemberPathsTest, NewRejectsParameterArguments) {
  EXPECT_THAT(GetMemberPaths(Parse("x => new(x.Name, x)")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Expression <new(x.Name, x)> cannot be used to select "
                       "a member."));
  EXPECT_THAT(ValidateMemberPath(Parse("x => new(x)")),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(GetMemberPathsTest, NullExpression) {
  EXPECT_THAT(GetMemberPaths(nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Expected an expression, but found <null>."));
  EXPECT_THAT(ValidateMemberPath(nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Expected an expression, but found <null>."));
}

TEST(GetMemberPathsTest, NonConstantIndex) {
  ExpressionPtr x = expr::Parameter(test::CustomerType());
  ASSERT_OK_AND_ASSIGN(ExpressionPtr tags, expr::MemberAccess(x, "Tags"));
  ASSERT_OK_AND_ASSIGN(ExpressionPtr age, expr::MemberAccess(x, "Age"));
  ASSERT_OK_AND_ASSIGN(ExpressionPtr item, expr::ArrayIndex(tags, age));
  ExpressionPtr lambda = expr::Lambda(item, x);
  EXPECT_THAT(GetMemberPaths(lambda),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Expression <x.Tags[x.Age]> cannot be used to select a "
                       "member."));
  EXPECT_THAT(ValidateMemberPath(lambda),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("cannot be used to select a member")));
}

TEST(GetMemberPathsTest, Arithmetic) {
  ExpressionPtr x = expr::Parameter(test::CustomerType());
  ASSERT_OK_AND_ASSIGN(ExpressionPtr age, expr::MemberAccess(x, "Age"));
  ExpressionPtr lambda =
      expr::Lambda(expr::Add(age, expr::Constant(Value(1))), x);
  EXPECT_THAT(GetMemberPaths(lambda),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Expression <(x.Age + 1)> cannot be used to select a "
                       "member."));
  EXPECT_THAT(ValidateMemberPath(lambda),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ValidateMemberPath(expr::Lambda(
                  expr::Multiply(age, expr::Constant(Value(2))), x)),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(GetMemberPathsTest, UnsupportedCalls) {
  ExpressionPtr x = expr::Parameter(test::CustomerType());
  ASSERT_OK_AND_ASSIGN(ExpressionPtr name, expr::MemberAccess(x, "Name"));
  EXPECT_THAT(
      GetMemberPaths(expr::Lambda(
          expr::Call(name, "ToUpper", {}, StringType()), x)),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "Expression <x.Name.ToUpper()> cannot be used to select a "
               "member."));

  ASSERT_OK_AND_ASSIGN(ExpressionPtr attributes,
                       expr::MemberAccess(x, "Attributes"));
  ExpressionPtr indexer_with_member =
      expr::Call(attributes, std::string(kIndexerMethodName), {name},
                 StringType());
  EXPECT_THAT(GetMemberPaths(expr::Lambda(indexer_with_member, x)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("<x.Attributes[x.Name]>")));
}

TEST(GetMemberPathsTest, Conditional) {
  ExpressionPtr x = expr::Parameter(test::CustomerType());
  ASSERT_OK_AND_ASSIGN(ExpressionPtr name, expr::MemberAccess(x, "Name"));
  ExpressionPtr lambda = expr::Lambda(
      expr::Conditional(expr::Constant(Value(true)), name, name), x);
  EXPECT_THAT(GetMemberPaths(lambda),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("IIF(true, x.Name, x.Name)")));
}

TEST(ValidateMemberPathTest, AcceptsSupportedShapes) {
  EXPECT_THAT(ValidateMemberPath(Parse("x => x.Address.City")), IsOk());
  EXPECT_THAT(ValidateMemberPath(Parse("x => x.Tags[0]")), IsOk());
  EXPECT_THAT(ValidateMemberPath(Parse("x => x.Attributes[\"a\"]")), IsOk());
  EXPECT_THAT(ValidateMemberPath(Parse("x => x")), IsOk());
  EXPECT_THAT(ValidateMemberPath(Parse("x => new(x.Name, x.Age)")), IsOk());
}

}  // namespace
}  // namespace equivalency

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
#include "equivalency/steps/enumerable_step.h"

#include <memory>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status_matchers.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/record.h"
#include "equivalency/test_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

using ::absl_testing::IsOkAndHolds;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

Value Ints(std::vector<Value> items) {
  return Value(std::make_shared<List>(ListOf(Int64Type()), std::move(items)));
}

TEST(EnumerableEquivalencyStepTest, CanHandle) {
  EnumerableEquivalencyStep step;
  EquivalencyOptions options;
  EXPECT_TRUE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(), Ints({}), ObjectType()),
      options));
  EXPECT_FALSE(step.CanHandle(
      EquivalencyValidationContext(Node(), Ints({}), Value(), ObjectType()),
      options));
  EXPECT_FALSE(step.CanHandle(
      EquivalencyValidationContext(Node(), Ints({}), Value("[]"),
                                   ObjectType()),
      options));
  EXPECT_EQ(step.ToString(), "Compare collections");
}

TEST(EnumerableEquivalencyStepTest, OrderIsIgnoredByDefault) {
  EXPECT_THAT(
      FindEquivalencyFailures(Ints({Value(3), Value(1), Value(2)}),
                              Ints({Value(1), Value(2), Value(3)})),
      IsOkAndHolds(IsEmpty()));
}

TEST(EnumerableEquivalencyStepTest, StrictOrdering) {
  EquivalencyOptions options;
  options.WithStrictOrdering();
  EXPECT_THAT(
      FindEquivalencyFailures(Ints({Value(1), Value(3), Value(2)}),
                              Ints({Value(1), Value(2), Value(3)}), options),
      IsOkAndHolds(ElementsAre(
          Failure{"[1]", "Expected item [1] to be 2, but found 3."},
          Failure{"[2]", "Expected item [2] to be 3, but found 2."})));
}

TEST(EnumerableEquivalencyStepTest, UnmatchedItemReportsClosestCandidate) {
  EXPECT_THAT(FindEquivalencyFailures(Ints({Value(1), Value(4)}),
                                      Ints({Value(1), Value(2)})),
              IsOkAndHolds(ElementsAre(
                  Failure{"[1]", "Expected item [1] to be 2, but found 4."})));

  auto address = [](const char* city) {
    return Value(test::MakeAddress("Main St", city));
  };
  auto addresses = [](std::vector<Value> items) {
    return Value(std::make_shared<List>(ListOf(test::AddressType()),
                                        std::move(items)));
  };
  EXPECT_THAT(
      FindEquivalencyFailures(addresses({address("Rome"), address("Oslo")}),
                              addresses({address("Oslo"), address("Lima")})),
      IsOkAndHolds(ElementsAre(
          Failure{"[1].City", "Expected member [1].City to be \"Lima\", but "
                              "\"Rome\" differs near index 0."})));
}

TEST(EnumerableEquivalencyStepTest, Count) {
  EXPECT_THAT(
      FindEquivalencyFailures(Ints({Value(1), Value(2)}),
                              Ints({Value(1), Value(2), Value(3)})),
      IsOkAndHolds(ElementsAre(Failure{
          "", "Expected collection to contain 3 item(s), but found 2."})));
}

TEST(EnumerableEquivalencyStepTest, SubjectIsNotACollection) {
  EXPECT_THAT(FindEquivalencyFailures(Value("1"), Ints({Value(1)})),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected collection to be a collection with 1 item(s), "
                      "but found \"1\"."})));
  EXPECT_THAT(FindEquivalencyFailures(Value(), Ints({})),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected collection to be a collection with 0 item(s), "
                      "but found <null>."})));
}

TEST(EnumerableEquivalencyStepTest, NestedInRecord) {
  auto subject = test::MakeCustomer("Ada", 36, nullptr);
  subject->Set("Tags", Value(std::make_shared<List>(
                           ListOf(StringType()),
                           std::vector<Value>{Value("old"), Value("vip")})));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject),
                              Value(test::MakeCustomer("Ada", 36, nullptr))),
      IsOkAndHolds(ElementsAre(Failure{
          "Tags[0]", "Expected item Tags[0] to be \"new\", but \"old\" "
                     "differs near index 0."})));
}

}  // namespace
}  // namespace equivalency::steps

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
#include "equivalency/steps/dictionary_step.h"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status_matchers.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/member_path.h"
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

std::shared_ptr<Dict> MakeDict() { return Dict::Create(); }

TEST(DictionaryEquivalencyStepTest, CanHandle) {
  DictionaryEquivalencyStep step;
  EquivalencyOptions options;
  EXPECT_TRUE(step.CanHandle(EquivalencyValidationContext(
                                 Node(), Value(), Value(MakeDict()),
                                 ObjectType()),
                             options));
  EXPECT_FALSE(step.CanHandle(
      EquivalencyValidationContext(Node(), Value(MakeDict()),
                                   Value(List::Create({})), ObjectType()),
      options));
  EXPECT_EQ(step.ToString(), "Compare dictionaries by key");
}

TEST(DictionaryEquivalencyStepTest, KeyOrderDoesNotMatter) {
  auto subject = MakeDict();
  subject->Set(Value("x"), Value(1)).Set(Value("y"), Value(2));
  auto expectation = MakeDict();
  expectation->Set(Value("y"), Value(2)).Set(Value("x"), Value(1));
  EXPECT_THAT(FindEquivalencyFailures(Value(subject), Value(expectation)),
              IsOkAndHolds(IsEmpty()));
}

TEST(DictionaryEquivalencyStepTest, MissingAndUnexpectedKeys) {
  auto subject = MakeDict();
  subject->Set(Value("x"), Value(1)).Set(Value(7), Value(3));
  auto expectation = MakeDict();
  expectation->Set(Value("x"), Value(1)).Set(Value("y"), Value(2));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation)),
      IsOkAndHolds(ElementsAre(
          Failure{"", "Expected dictionary to contain key \"y\", but did not "
                      "find it."},
          Failure{"", "Expected dictionary not to contain key 7, but found "
                      "it."})));
}

TEST(DictionaryEquivalencyStepTest, Values) {
  auto subject = MakeDict();
  subject->Set(Value("x"), Value(1)).Set(Value(2), Value(true));
  auto expectation = MakeDict();
  expectation->Set(Value("x"), Value(5)).Set(Value(2), Value(false));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation)),
      IsOkAndHolds(ElementsAre(
          Failure{"[x]", "Expected item [x] to be 5, but found 1."},
          Failure{"[2]", "Expected item [2] to be false, but found true."})));
}

TEST(DictionaryEquivalencyStepTest, SubjectIsNotADictionary) {
  auto expectation = MakeDict();
  expectation->Set(Value("x"), Value(1));
  EXPECT_THAT(FindEquivalencyFailures(Value(5), Value(expectation)),
              IsOkAndHolds(ElementsAre(Failure{
                  "", "Expected dictionary to be a dictionary with 1 item(s), "
                      "but found 5."})));
}

TEST(DictionaryEquivalencyStepTest, NestedInRecord) {
  auto attributes = [](const char* color) {
    auto dict = std::make_shared<Dict>(DictOf(StringType(), StringType()));
    dict->Set(Value("color"), Value(color));
    return Value(dict);
  };
  auto subject = test::MakeCustomer("Ada", 36, nullptr);
  subject->Set("Attributes", attributes("blue"));
  auto expectation = test::MakeCustomer("Ada", 36, nullptr);
  expectation->Set("Attributes", attributes("red"));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation)),
      IsOkAndHolds(ElementsAre(Failure{
          "Attributes[color]",
          "Expected item Attributes[color] to be \"red\" with a length of 3, "
          "but \"blue\" has a length of 4, differs near index 0."})));

  EquivalencyOptions options;
  options.Excluding(MemberPath("Attributes"));
  EXPECT_THAT(
      FindEquivalencyFailures(Value(subject), Value(expectation), options),
      IsOkAndHolds(IsEmpty()));
}

}  // namespace
}  // namespace equivalency::steps

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
#include "equivalency/steps/string_step.h"

#include <cstddef>
#include <string>

#include "absl/status/statusor.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

size_t FirstDifference(const std::string& a, const std::string& b) {
  size_t i = 0;
  while (i < a.size() && i < b.size() && a[i] == b[i]) {
    ++i;
  }
  return i;
}

}  // namespace

bool StringEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return context.expectation().holds_value<std::string>();
}

absl::StatusOr<bool> StringEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const Value& subject = context.subject();
  const Value& expectation = context.expectation();
  if (!subject.holds_value<std::string>()) {
    scope.FailWith("Expected {context:string} to be {0}{reason}, but found {1}.",
                   expectation, subject);
    return true;
  }
  const std::string& actual = subject.value<std::string>();
  const std::string& expected = expectation.value<std::string>();
  if (actual == expected) {
    return true;
  }
  const size_t index = FirstDifference(actual, expected);
  if (actual.size() != expected.size()) {
    scope.FailWith(
        "Expected {context:string} to be {0} with a length of {1}{reason}, but "
        "{2} has a length of {3}, differs near index {4}.",
        expectation, expected.size(), subject, actual.size(), index);
  } else {
    scope.FailWith(
        "Expected {context:string} to be {0}{reason}, but {1} differs near "
        "index {2}.",
        expectation, subject, index);
  }
  return true;
}

std::string StringEquivalencyStep::ToString() const {
  return "Compare strings";
}

}  // namespace equivalency::steps

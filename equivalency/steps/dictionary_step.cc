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

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/record.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {

bool DictionaryEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return context.expectation().As<Dict>() != nullptr;
}

absl::StatusOr<bool> DictionaryEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const Dict& expectation = *context.expectation().As<Dict>();
  const Dict* subject = context.subject().As<Dict>();
  if (subject == nullptr) {
    scope.FailWith(
        "Expected {context:dictionary} to be a dictionary with {0} item(s)"
        "{reason}, but found {1}.",
        expectation.size(), context.subject());
    return true;
  }

  for (const auto& [key, expectation_value] : expectation.entries()) {
    const Value* subject_value = subject->Find(key);
    if (subject_value == nullptr) {
      scope.FailWith(
          "Expected {context:dictionary} to contain key {0}{reason}, but did "
          "not find it.",
          key);
      continue;
    }
    std::optional<EquivalencyValidationContext> nested =
        context.AsCollectionItem(ValueText(key), *subject_value,
                                 expectation_value);
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  for (const Dict::Entry& entry : subject->entries()) {
    scope.ForCondition(expectation.Find(entry.first) != nullptr)
        .FailWith("Expected {context:dictionary} not to contain key {0}"
                  "{reason}, but found it.",
                  entry.first);
  }
  return true;
}

std::string DictionaryEquivalencyStep::ToString() const {
  return "Compare dictionaries by key";
}

}  // namespace equivalency::steps

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

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/record.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

absl::Status CompareByIndex(const EquivalencyValidationContext& context,
                            const List& subject, const List& expectation,
                            EquivalencyValidator& parent,
                            const EquivalencyOptions& options) {
  const size_t count = std::min(subject.size(), expectation.size());
  for (size_t i = 0; i < count; ++i) {
    std::optional<EquivalencyValidationContext> nested =
        context.AsCollectionItem(i, subject.items()[i], expectation.items()[i]);
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  return absl::OkStatus();
}

absl::Status CompareInAnyOrder(const EquivalencyValidationContext& context,
                               const List& subject, const List& expectation,
                               EquivalencyValidator& parent,
                               const EquivalencyOptions& options) {
  std::vector<bool> matched(subject.size(), false);
  for (size_t i = 0; i < expectation.size(); ++i) {
    bool found = false;
    std::optional<std::vector<Failure>> closest;
    for (size_t j = 0; j < subject.size() && !found; ++j) {
      if (matched[j]) {
        continue;
      }
      std::optional<EquivalencyValidationContext> nested =
          context.AsCollectionItem(i, subject.items()[j],
                                   expectation.items()[i]);
      if (nested.has_value()) {
        ASSIGN_OR_RETURN(std::vector<Failure> failures,
                         parent.TryAssertEqualityUsing(*nested, options));
        if (!failures.empty()) {
          if (!closest.has_value() || failures.size() < closest->size()) {
            closest = std::move(failures);
          }
          continue;
        }
      }
      matched[j] = true;
      found = true;
    }
    if (!found && closest.has_value()) {
      parent.scope().AddFailures(*std::move(closest));
    }
  }
  return absl::OkStatus();
}

}  // namespace

bool EnumerableEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return context.expectation().As<List>() != nullptr;
}

absl::StatusOr<bool> EnumerableEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const List& expectation = *context.expectation().As<List>();
  const List* subject = context.subject().As<List>();
  if (subject == nullptr) {
    scope.FailWith(
        "Expected {context:collection} to be a collection with {0} item(s)"
        "{reason}, but found {1}.",
        expectation.size(), context.subject());
    return true;
  }
  scope.ForCondition(subject->size() == expectation.size())
      .FailWith("Expected {context:collection} to contain {0} item(s){reason}, "
                "but found {1}.",
                expectation.size(), subject->size());
  if (options.strict_ordering()) {
    RETURN_IF_ERROR(
        CompareByIndex(context, *subject, expectation, parent, options));
  } else {
    RETURN_IF_ERROR(
        CompareInAnyOrder(context, *subject, expectation, parent, options));
  }
  return true;
}

std::string EnumerableEquivalencyStep::ToString() const {
  return "Compare collections";
}

}  // namespace equivalency::steps

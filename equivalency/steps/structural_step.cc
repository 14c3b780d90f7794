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
#include "equivalency/steps/structural_step.h"

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/steps/step_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {

bool StructuralEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return context.expectation().is_object();
}

absl::StatusOr<bool> StructuralEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  if (!context.subject().is_object()) {
    scope.FailWith("Expected {context:object} to be {0}{reason}, but found {1}.",
                   context.expectation(), context.subject());
    return true;
  }
  const Type& type = options.GetExpectationType(context.runtime_type(),
                                                context.compile_time_type());
  if (type.GetMembers().empty()) {
    // Nothing to look into, so only identical objects are equivalent, and
    // those never get here.
    scope.FailWith("Expected {context:object} to be {0}{reason}, but found {1}.",
                   context.expectation(), context.subject());
    return true;
  }

  for (const Member* member : GetMembersFromExpectation(context, options)) {
    const Member* match = FindMatchFor(*member, context, options, scope);
    if (match == nullptr) {
      continue;
    }
    std::optional<EquivalencyValidationContext> nested =
        context.AsNestedMember(*member, *match);
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  return true;
}

std::string StructuralEquivalencyStep::ToString() const {
  return "Compare objects member by member";
}

}  // namespace equivalency::steps

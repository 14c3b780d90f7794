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
#include "equivalency/steps/reference_equality_step.h"

#include <string>

#include "absl/status/statusor.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {

bool ReferenceEqualityEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  const Value& subject = context.subject();
  const Value& expectation = context.expectation();
  if (subject.is_null() && expectation.is_null()) {
    return true;
  }
  return subject.is_object() && subject.object() == expectation.object();
}

absl::StatusOr<bool> ReferenceEqualityEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  return true;
}

std::string ReferenceEqualityEquivalencyStep::ToString() const {
  return "Treat the same object or two nulls as equivalent";
}

}  // namespace equivalency::steps

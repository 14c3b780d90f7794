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
#include "equivalency/equivalency.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency {

absl::StatusOr<std::vector<Failure>> FindEquivalencyFailures(
    const Value& subject, const Value& expectation,
    const Type& expectation_type, const EquivalencyOptions& options,
    absl::string_view because) {
  AssertionScope scope;
  scope.BecauseOf(because);
  {
    EquivalencyValidator validator(scope);
    RETURN_IF_ERROR(validator.AssertEqualityUsing(
        EquivalencyValidationContext(Node(), subject, expectation,
                                     expectation_type),
        options));
  }
  return scope.Discard();
}

absl::StatusOr<std::vector<Failure>> FindEquivalencyFailures(
    const Value& subject, const Value& expectation,
    const EquivalencyOptions& options, absl::string_view because) {
  return FindEquivalencyFailures(subject, expectation, ObjectType(), options,
                                 because);
}

absl::Status AssertEquivalent(const Value& subject, const Value& expectation,
                              const Type& expectation_type,
                              const EquivalencyOptions& options,
                              absl::string_view because) {
  ASSIGN_OR_RETURN(std::vector<Failure> failures,
                   FindEquivalencyFailures(subject, expectation,
                                           expectation_type, options, because));
  if (failures.empty()) {
    return absl::OkStatus();
  }
  return absl::FailedPreconditionError(absl::StrCat(
      absl::StrJoin(failures, "\n",
                    [](std::string* out, const Failure& failure) {
                      absl::StrAppend(out, failure.message);
                    }),
      "\n\nWith configuration:\n", options.ToString()));
}

absl::Status AssertEquivalent(const Value& subject, const Value& expectation,
                              const EquivalencyOptions& options,
                              absl::string_view because) {
  return AssertEquivalent(subject, expectation, ObjectType(), options,
                          because);
}

}  // namespace equivalency

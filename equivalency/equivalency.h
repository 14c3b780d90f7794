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
#ifndef EQUIVALENCY_EQUIVALENCY_H_
#define EQUIVALENCY_EQUIVALENCY_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

// Compares `subject` with `expectation` and returns every mismatch found.
// `expectation_type` is the declared type of the expectation; members are
// selected from it unless runtime types are respected. `because` is inserted
// at the {reason} placeholder of the messages.
//
// Returns an error only if the comparison itself could not be done, e.g.
// because no step could handle a pair of values.
absl::StatusOr<std::vector<Failure>> FindEquivalencyFailures(
    const Value& subject, const Value& expectation,
    const Type& expectation_type,
    const EquivalencyOptions& options = EquivalencyOptions(),
    absl::string_view because = "");

// Same, with the root object type as declared type, so the members of the
// runtime type of the expectation are compared.
absl::StatusOr<std::vector<Failure>> FindEquivalencyFailures(
    const Value& subject, const Value& expectation,
    const EquivalencyOptions& options = EquivalencyOptions(),
    absl::string_view because = "");

// Returns FailedPreconditionError listing all mismatches and the
// configuration if `subject` is not equivalent to `expectation`.
//
// Example:
//   RETURN_IF_ERROR(AssertEquivalent(
//       Value(actual), Value(expected),
//       EquivalencyOptions().ExcludingTable("Audit")));
absl::Status AssertEquivalent(
    const Value& subject, const Value& expectation,
    const Type& expectation_type,
    const EquivalencyOptions& options = EquivalencyOptions(),
    absl::string_view because = "");
absl::Status AssertEquivalent(
    const Value& subject, const Value& expectation,
    const EquivalencyOptions& options = EquivalencyOptions(),
    absl::string_view because = "");

}  // namespace equivalency

#endif  // EQUIVALENCY_EQUIVALENCY_H_

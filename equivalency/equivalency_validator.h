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
#ifndef EQUIVALENCY_EQUIVALENCY_VALIDATOR_H_
#define EQUIVALENCY_EQUIVALENCY_VALIDATOR_H_

#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency {

// Drives one traversal: runs the step chain on every compared pair and keeps
// track of the pairs on the active path, so that cyclic graphs terminate.
//
// Not thread-safe. One validator serves one top-level comparison.
class EquivalencyValidator {
 public:
  // Failures are reported to `root_scope`, which must outlive the validator.
  explicit EquivalencyValidator(AssertionScope& root_scope)
      : current_scope_(&root_scope) {}

  EquivalencyValidator(const EquivalencyValidator&) = delete;
  EquivalencyValidator& operator=(const EquivalencyValidator&) = delete;

  // Compares the pair described by `context`. Mismatches are reported to the
  // current scope. Returns an error if no step handled the pair or a step
  // failed.
  absl::Status AssertEqualityUsing(const EquivalencyValidationContext& context,
                                   const EquivalencyOptions& options);

  // Same as AssertEqualityUsing, but in an isolated scope. Returns the
  // failures instead of reporting them.
  absl::StatusOr<std::vector<Failure>> TryAssertEqualityUsing(
      const EquivalencyValidationContext& context,
      const EquivalencyOptions& options);

  // Scope of the node being compared.
  AssertionScope& scope() const { return *current_scope_; }

 private:
  using ObjectPair = std::pair<const Object*, const Object*>;

  absl::Status RunSteps(const EquivalencyValidationContext& context,
                        const EquivalencyOptions& options);

  AssertionScope* current_scope_;
  // (subject, expectation) objects being compared on the active path.
  absl::flat_hash_set<ObjectPair> active_pairs_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_EQUIVALENCY_VALIDATOR_H_

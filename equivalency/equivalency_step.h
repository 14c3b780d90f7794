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
#ifndef EQUIVALENCY_EQUIVALENCY_STEP_H_
#define EQUIVALENCY_EQUIVALENCY_STEP_H_

#include <string>

#include "absl/status/statusor.h"
#include "equivalency/validation_context.h"

namespace equivalency {

class EquivalencyOptions;
class EquivalencyValidator;

// Compares one category of node pairs.
//
// The validator asks the steps in order. The first step that can handle a
// pair and returns true from Handle finishes the node; returning true means
// that no other step should look at the pair, not that the pair is
// equivalent. Mismatches are reported to `parent.scope()`. Steps recurse by
// calling `parent.AssertEqualityUsing` with a nested context.
class EquivalencyStep {
 public:
  virtual ~EquivalencyStep() = default;

  virtual bool CanHandle(const EquivalencyValidationContext& context,
                         const EquivalencyOptions& options) const = 0;

  // Errors are reserved for misuse and library invariants, never for
  // mismatches.
  virtual absl::StatusOr<bool> Handle(
      const EquivalencyValidationContext& context,
      EquivalencyValidator& parent,
      const EquivalencyOptions& options) const = 0;

  virtual std::string ToString() const = 0;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_EQUIVALENCY_STEP_H_

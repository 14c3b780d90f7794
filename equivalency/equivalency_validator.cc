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
#include "equivalency/equivalency_validator.h"

#include <string>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_step.h"
#include "equivalency/validation_context.h"

namespace equivalency {

absl::Status EquivalencyValidator::AssertEqualityUsing(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) {
  const Node& node = context.node();
  if (!options.allow_infinite_recursion() &&
      node.depth() > options.max_recursion_depth()) {
    LOG(WARNING) << "maximum recursion depth of "
                 << options.max_recursion_depth() << " reached at "
                 << node.path();
    AssertionScope scope(*current_scope_, node.path(), node.description());
    scope.FailWith("The maximum recursion depth of {0} was reached.",
                   options.max_recursion_depth());
    return absl::OkStatus();
  }

  const ObjectPair pair(context.subject().object(),
                        context.expectation().object());
  bool tracked = false;
  if (pair.first != nullptr && pair.second != nullptr) {
    if (active_pairs_.contains(pair)) {
      if (options.cyclic_reference_handling() ==
          CyclicReferenceHandling::kFail) {
        AssertionScope scope(*current_scope_, node.path(), node.description());
        scope.FailWith(
            "Expected {context:subject} to be {0}{reason}, but it contains a "
            "cyclic reference.",
            context.expectation());
      }
      return absl::OkStatus();
    }
    active_pairs_.insert(pair);
    tracked = true;
  }
  absl::Cleanup untrack = [&] {
    if (tracked) {
      active_pairs_.erase(pair);
    }
  };

  AssertionScope scope(*current_scope_, node.path(), node.description());
  AssertionScope* previous_scope = current_scope_;
  current_scope_ = &scope;
  absl::Cleanup restore_scope = [&] { current_scope_ = previous_scope; };

  return RunSteps(context, options);
}

absl::Status EquivalencyValidator::RunSteps(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) {
  for (const EquivalencyStep* step : options.steps()) {
    if (!step->CanHandle(context, options)) {
      continue;
    }
    ASSIGN_OR_RETURN(bool handled, step->Handle(context, *this, options));
    if (handled) {
      return absl::OkStatus();
    }
  }
  const std::string path =
      context.node().is_root() ? "the root" : context.node().path();
  LOG(ERROR) << "no equivalency step handled " << path;
  return absl::InternalError(absl::StrFormat(
      "no equivalency step was able to handle %s (expectation type %s, "
      "subject type %s)",
      path, context.runtime_type().name(), context.subject().GetType().name()));
}

absl::StatusOr<std::vector<Failure>>
EquivalencyValidator::TryAssertEqualityUsing(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) {
  AssertionScope isolated_scope;
  isolated_scope.BecauseOf(current_scope_->reason());
  AssertionScope* previous_scope = current_scope_;
  current_scope_ = &isolated_scope;
  absl::Cleanup restore_scope = [&] { current_scope_ = previous_scope; };

  RETURN_IF_ERROR(AssertEqualityUsing(context, options));
  return isolated_scope.Discard();
}

}  // namespace equivalency

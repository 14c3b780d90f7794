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
#ifndef EQUIVALENCY_EQUIVALENCY_OPTIONS_H_
#define EQUIVALENCY_EQUIVALENCY_OPTIONS_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "equivalency/equivalency_step.h"
#include "equivalency/matching_rules.h"
#include "equivalency/member_path.h"
#include "equivalency/selection_rules.h"
#include "equivalency/type.h"

namespace equivalency {

enum class CyclicReferenceHandling {
  // A pair that is already being compared higher up the path is treated as
  // equivalent.
  kIgnore,
  // Same, but a failure is reported.
  kFail,
};

inline constexpr int kDefaultMaxRecursionDepth = 10;

// Configuration of an equivalency comparison.
//
// A copyable value: rules and steps are immutable and shared between copies.
// Comparisons never modify the options they are given; steps that need a
// narrower configuration for a subtree work on a copy.
//
// Example:
//   EquivalencyOptions options;
//   options.Excluding(MemberPath("Customer.Id"))
//       .WithStrictOrdering()
//       .ExcludingTable("Audit");
class EquivalencyOptions {
 public:
  using StepPtr = std::shared_ptr<const EquivalencyStep>;
  using SelectionRulePtr = std::shared_ptr<const MemberSelectionRule>;
  using MatchingRulePtr = std::shared_ptr<const MemberMatchingRule>;

  // Selects all members, matches them by name and uses the default steps.
  EquivalencyOptions();

  // Member selection.
  EquivalencyOptions& Excluding(MemberPath path);
  EquivalencyOptions& Excluding(
      ExcludeMemberByPredicateSelectionRule::Predicate predicate,
      std::string description);
  // Only compares the included members. The first call removes the rule
  // selecting all members.
  EquivalencyOptions& Including(MemberPath path);
  EquivalencyOptions& Using(SelectionRulePtr rule);

  // Member matching.
  EquivalencyOptions& ExcludingMissingMembers();
  EquivalencyOptions& WithMapping(std::string expectation_member_name,
                                  std::string subject_member_name);
  EquivalencyOptions& Using(MatchingRulePtr rule);

  // Steps added with Using run before the default steps, in registration
  // order.
  EquivalencyOptions& Using(StepPtr step);
  EquivalencyOptions& WithoutDefaultSteps();

  // Traversal.
  EquivalencyOptions& WithStrictOrdering();
  EquivalencyOptions& WithoutStrictOrdering();
  EquivalencyOptions& RespectingRuntimeTypes();
  EquivalencyOptions& RespectingDeclaredTypes();
  EquivalencyOptions& WithMaxRecursionDepth(int depth);
  EquivalencyOptions& AllowingInfiniteRecursion();
  EquivalencyOptions& IgnoringCyclicReferences();
  EquivalencyOptions& FailingOnCyclicReferences();

  // Tabular data.
  EquivalencyOptions& AllowingMismatchedTypes();
  EquivalencyOptions& ExcludingTable(absl::string_view table_name);
  EquivalencyOptions& ExcludingTables(
      absl::Span<const std::string> table_names);
  EquivalencyOptions& ExcludingColumn(absl::string_view table_name,
                                      absl::string_view column_name);
  EquivalencyOptions& ExcludingColumnInAllTables(absl::string_view column_name);

  const std::vector<SelectionRulePtr>& selection_rules() const {
    return selection_rules_;
  }
  const std::vector<MatchingRulePtr>& matching_rules() const {
    return matching_rules_;
  }
  // User steps followed by the default steps.
  std::vector<const EquivalencyStep*> steps() const;

  bool strict_ordering() const { return strict_ordering_; }
  bool respect_runtime_types() const { return respect_runtime_types_; }
  int max_recursion_depth() const { return max_recursion_depth_; }
  bool allow_infinite_recursion() const { return allow_infinite_recursion_; }
  CyclicReferenceHandling cyclic_reference_handling() const {
    return cyclic_reference_handling_;
  }
  bool allow_mismatched_types() const { return allow_mismatched_types_; }

  bool ShouldExcludeTable(absl::string_view table_name) const;
  bool ShouldExcludeColumn(absl::string_view table_name,
                           absl::string_view column_name) const;

  // The type whose members are compared: the runtime type when runtime types
  // are respected, otherwise the compile time type unless it is the root
  // object type.
  const Type& GetExpectationType(const Type& runtime_type,
                                 const Type& compile_time_type) const;

  // Describes the configuration, one rule per line.
  std::string ToString() const;

 private:
  std::vector<SelectionRulePtr> selection_rules_;
  std::vector<MatchingRulePtr> matching_rules_;
  std::vector<StepPtr> user_steps_;
  bool use_default_steps_ = true;
  bool has_inclusions_ = false;
  bool strict_ordering_ = false;
  bool respect_runtime_types_ = false;
  int max_recursion_depth_ = kDefaultMaxRecursionDepth;
  bool allow_infinite_recursion_ = false;
  CyclicReferenceHandling cyclic_reference_handling_ =
      CyclicReferenceHandling::kIgnore;
  bool allow_mismatched_types_ = false;
  absl::flat_hash_set<std::string> excluded_tables_;
  // Columns excluded in every table.
  absl::flat_hash_set<std::string> excluded_columns_;
  // (table, column) pairs.
  absl::flat_hash_set<std::pair<std::string, std::string>>
      excluded_table_columns_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_EQUIVALENCY_OPTIONS_H_

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
#include "equivalency/equivalency_options.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "equivalency/equivalency_step.h"
#include "equivalency/matching_rules.h"
#include "equivalency/member_path.h"
#include "equivalency/selection_rules.h"
#include "equivalency/steps/default_steps.h"
#include "equivalency/type.h"

namespace equivalency {
namespace {

template <typename Rule, typename T>
bool IsA(const std::shared_ptr<const T>& rule) {
  return dynamic_cast<const Rule*>(rule.get()) != nullptr;
}

std::vector<std::string> Sorted(const absl::flat_hash_set<std::string>& set) {
  std::vector<std::string> result(set.begin(), set.end());
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace

EquivalencyOptions::EquivalencyOptions() {
  selection_rules_.push_back(std::make_shared<AllMembersSelectionRule>());
  matching_rules_.push_back(std::make_shared<MustMatchByNameRule>());
}

EquivalencyOptions& EquivalencyOptions::Excluding(MemberPath path) {
  return Using(
      std::make_shared<ExcludeMemberByPathSelectionRule>(std::move(path)));
}

EquivalencyOptions& EquivalencyOptions::Excluding(
    ExcludeMemberByPredicateSelectionRule::Predicate predicate,
    std::string description) {
  return Using(std::make_shared<ExcludeMemberByPredicateSelectionRule>(
      std::move(predicate), std::move(description)));
}

EquivalencyOptions& EquivalencyOptions::Including(MemberPath path) {
  if (!has_inclusions_) {
    selection_rules_.erase(
        std::remove_if(selection_rules_.begin(), selection_rules_.end(),
                       [](const SelectionRulePtr& rule) {
                         return IsA<AllMembersSelectionRule>(rule);
                       }),
        selection_rules_.end());
    has_inclusions_ = true;
  }
  return Using(
      std::make_shared<IncludeMemberByPathSelectionRule>(std::move(path)));
}

EquivalencyOptions& EquivalencyOptions::Using(SelectionRulePtr rule) {
  DCHECK(rule != nullptr);
  selection_rules_.push_back(std::move(rule));
  return *this;
}

EquivalencyOptions& EquivalencyOptions::ExcludingMissingMembers() {
  for (MatchingRulePtr& rule : matching_rules_) {
    if (IsA<MustMatchByNameRule>(rule)) {
      rule = std::make_shared<TryMatchByNameRule>();
    }
  }
  return *this;
}

EquivalencyOptions& EquivalencyOptions::WithMapping(
    std::string expectation_member_name, std::string subject_member_name) {
  return Using(std::make_shared<MappedMemberMatchingRule>(
      std::move(expectation_member_name), std::move(subject_member_name)));
}

EquivalencyOptions& EquivalencyOptions::Using(MatchingRulePtr rule) {
  DCHECK(rule != nullptr);
  // Keep the by-name rule last, so that custom rules get a chance first.
  auto by_name = std::find_if(
      matching_rules_.begin(), matching_rules_.end(),
      [](const MatchingRulePtr& r) {
        return IsA<MustMatchByNameRule>(r) || IsA<TryMatchByNameRule>(r);
      });
  matching_rules_.insert(by_name, std::move(rule));
  return *this;
}

EquivalencyOptions& EquivalencyOptions::Using(StepPtr step) {
  DCHECK(step != nullptr);
  user_steps_.push_back(std::move(step));
  return *this;
}

EquivalencyOptions& EquivalencyOptions::WithoutDefaultSteps() {
  use_default_steps_ = false;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::WithStrictOrdering() {
  strict_ordering_ = true;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::WithoutStrictOrdering() {
  strict_ordering_ = false;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::RespectingRuntimeTypes() {
  respect_runtime_types_ = true;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::RespectingDeclaredTypes() {
  respect_runtime_types_ = false;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::WithMaxRecursionDepth(int depth) {
  CHECK_GE(depth, 0);
  max_recursion_depth_ = depth;
  allow_infinite_recursion_ = false;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::AllowingInfiniteRecursion() {
  allow_infinite_recursion_ = true;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::IgnoringCyclicReferences() {
  cyclic_reference_handling_ = CyclicReferenceHandling::kIgnore;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::FailingOnCyclicReferences() {
  cyclic_reference_handling_ = CyclicReferenceHandling::kFail;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::AllowingMismatchedTypes() {
  allow_mismatched_types_ = true;
  return *this;
}

EquivalencyOptions& EquivalencyOptions::ExcludingTable(
    absl::string_view table_name) {
  excluded_tables_.insert(std::string(table_name));
  return *this;
}

EquivalencyOptions& EquivalencyOptions::ExcludingTables(
    absl::Span<const std::string> table_names) {
  excluded_tables_.insert(table_names.begin(), table_names.end());
  return *this;
}

EquivalencyOptions& EquivalencyOptions::ExcludingColumn(
    absl::string_view table_name, absl::string_view column_name) {
  excluded_table_columns_.emplace(std::string(table_name),
                                  std::string(column_name));
  return *this;
}

EquivalencyOptions& EquivalencyOptions::ExcludingColumnInAllTables(
    absl::string_view column_name) {
  excluded_columns_.insert(std::string(column_name));
  return *this;
}

std::vector<const EquivalencyStep*> EquivalencyOptions::steps() const {
  std::vector<const EquivalencyStep*> result;
  for (const StepPtr& step : user_steps_) {
    result.push_back(step.get());
  }
  if (use_default_steps_) {
    for (const StepPtr& step : steps::DefaultSteps()) {
      result.push_back(step.get());
    }
  }
  return result;
}

bool EquivalencyOptions::ShouldExcludeTable(
    absl::string_view table_name) const {
  return excluded_tables_.contains(table_name);
}

bool EquivalencyOptions::ShouldExcludeColumn(
    absl::string_view table_name, absl::string_view column_name) const {
  return excluded_columns_.contains(column_name) ||
         excluded_table_columns_.contains(
             std::make_pair(std::string(table_name), std::string(column_name)));
}

const Type& EquivalencyOptions::GetExpectationType(
    const Type& runtime_type, const Type& compile_time_type) const {
  if (respect_runtime_types_ || &compile_time_type == &ObjectType()) {
    return runtime_type;
  }
  return compile_time_type;
}

std::string EquivalencyOptions::ToString() const {
  std::vector<std::string> lines;
  lines.push_back(respect_runtime_types_
                      ? "Use runtime types and members"
                      : "Use declared types and members");
  for (const SelectionRulePtr& rule : selection_rules_) {
    lines.push_back(rule->ToString());
  }
  for (const MatchingRulePtr& rule : matching_rules_) {
    lines.push_back(rule->ToString());
  }
  lines.push_back(strict_ordering_ ? "Use strict ordering of collections"
                                   : "Ignore the order of collections");
  lines.push_back(allow_infinite_recursion_
                      ? "Allow infinite recursion"
                      : absl::StrCat("Stop at a recursion depth of ",
                                     max_recursion_depth_));
  lines.push_back(cyclic_reference_handling_ == CyclicReferenceHandling::kFail
                      ? "Fail on cyclic references"
                      : "Ignore cyclic references");
  if (allow_mismatched_types_) {
    lines.push_back("Allow mismatched types");
  }
  for (const std::string& table : Sorted(excluded_tables_)) {
    lines.push_back(absl::StrCat("Exclude table ", table));
  }
  for (const std::string& column : Sorted(excluded_columns_)) {
    lines.push_back(absl::StrCat("Exclude column ", column, " in all tables"));
  }
  std::vector<std::pair<std::string, std::string>> table_columns(
      excluded_table_columns_.begin(), excluded_table_columns_.end());
  std::sort(table_columns.begin(), table_columns.end());
  for (const auto& [table, column] : table_columns) {
    lines.push_back(absl::StrCat("Exclude column ", table, ".", column));
  }
  for (const StepPtr& step : user_steps_) {
    lines.push_back(step->ToString());
  }
  if (!use_default_steps_) {
    lines.push_back("Without default steps");
  }
  return absl::StrCat("- ", absl::StrJoin(lines, "\n- "));
}

}  // namespace equivalency

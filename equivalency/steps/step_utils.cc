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
#include "equivalency/steps/step_utils.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/selection_rules.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

const NamedItem* FindItem(const std::vector<NamedItem>& items,
                          absl::string_view name) {
  for (const NamedItem& item : items) {
    if (item.name == name) {
      return &item;
    }
  }
  return nullptr;
}

}  // namespace

std::vector<const Member*> GetMembersFromExpectation(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) {
  const MemberSelectionContext selection_context{
      context.compile_time_type(), context.runtime_type(), options};
  std::vector<const Member*> members;
  for (const auto& rule : options.selection_rules()) {
    members = rule->SelectMembers(context.node(), std::move(members),
                                  selection_context);
  }
  return members;
}

SelectedMembers GetSelectedMembersByName(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) {
  SelectedMembers result;
  for (const Member* member : GetMembersFromExpectation(context, options)) {
    result.emplace(member->name(), member);
  }
  return result;
}

const Member* FindMatchFor(const Member& expectation_member,
                           const EquivalencyValidationContext& context,
                           const EquivalencyOptions& options,
                           AssertionScope& scope) {
  for (const auto& rule : options.matching_rules()) {
    if (const Member* match = rule->Match(expectation_member,
                                          context.subject(), context.node(),
                                          options, scope)) {
      return match;
    }
  }
  return nullptr;
}

bool IsExpectationOfType(const EquivalencyValidationContext& context,
                         const EquivalencyOptions& options, const Type& type) {
  return type.IsAssignableFrom(options.GetExpectationType(
      context.runtime_type(), context.compile_time_type()));
}

void CompareScalarMembers(const EquivalencyValidationContext& context,
                          const SelectedMembers& selected,
                          absl::string_view label,
                          absl::Span<const absl::string_view> member_names,
                          AssertionScope& scope) {
  for (absl::string_view name : member_names) {
    auto it = selected.find(name);
    if (it == selected.end()) {
      continue;
    }
    const Member& member = *it->second;
    Value expected = member.GetValue(context.expectation());
    Value actual = member.GetValue(context.subject());
    // Names read "to have TableName 'x'", other properties "to have Locale
    // value of 'x'".
    std::string message_template =
        absl::EndsWith(name, "Name")
            ? absl::StrCat("Expected {context:", label, "} to have ", name,
                           " '{0}'{reason}, but found '{1}' instead")
            : absl::StrCat("Expected {context:", label, "} to have ", name,
                           " value of '{0}'{reason}, but found '{1}' instead");
    scope.ForCondition(actual == expected)
        .FailWith(message_template, ValueText(expected), ValueText(actual));
  }
}

absl::Status CompareMatchedMember(const EquivalencyValidationContext& context,
                                  const SelectedMembers& selected,
                                  absl::string_view member_name,
                                  EquivalencyValidator& parent,
                                  const EquivalencyOptions& options) {
  auto it = selected.find(member_name);
  if (it == selected.end()) {
    return absl::OkStatus();
  }
  const Member& expectation_member = *it->second;
  const Member* match =
      FindMatchFor(expectation_member, context, options, parent.scope());
  if (match == nullptr) {
    return absl::OkStatus();
  }
  std::optional<EquivalencyValidationContext> nested =
      context.AsNestedMember(expectation_member, *match);
  if (!nested.has_value()) {
    return absl::OkStatus();
  }
  return parent.AssertEqualityUsing(*nested, options);
}

absl::Status CompareItemsByName(
    const EquivalencyValidationContext& context,
    const NamedCollection& collection,
    const std::vector<NamedItem>& subject_items,
    const std::vector<NamedItem>& expectation_items,
    absl::FunctionRef<bool(absl::string_view)> is_excluded,
    EquivalencyValidator& parent, const EquivalencyOptions& options) {
  std::vector<absl::string_view> names;
  absl::flat_hash_set<absl::string_view> seen;
  for (const auto* items : {&expectation_items, &subject_items}) {
    for (const NamedItem& item : *items) {
      if (seen.insert(item.name).second) {
        names.push_back(item.name);
      }
    }
  }

  const std::string missing_template =
      absl::StrCat("Expected {context:", collection.owner_label,
                   "} to contain ", collection.item_noun,
                   " '{0}'{reason}, but did not find it");
  const std::string unexpected_template =
      absl::StrCat("Found unexpected ", collection.item_noun, " '{0}' in ",
                   collection.owner_label);
  const EquivalencyValidationContext collection_context(
      context.node().ChildMember(collection.member_name), Value(), Value(),
      ListOf(*collection.item_type));

  AssertionScope& scope = parent.scope();
  for (absl::string_view name : names) {
    if (is_excluded(name)) {
      continue;
    }
    const NamedItem* expectation_item = FindItem(expectation_items, name);
    const NamedItem* subject_item = FindItem(subject_items, name);
    scope.ForCondition(subject_item != nullptr)
        .FailWith(missing_template, name);
    scope.ForCondition(expectation_item != nullptr)
        .FailWith(unexpected_template, name);
    if (subject_item == nullptr || expectation_item == nullptr) {
      continue;
    }
    std::optional<EquivalencyValidationContext> nested =
        collection_context.AsCollectionItem(name, subject_item->value,
                                            expectation_item->value,
                                            collection.item_type);
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  return absl::OkStatus();
}

}  // namespace equivalency::steps

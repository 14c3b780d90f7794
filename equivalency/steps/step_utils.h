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
#ifndef EQUIVALENCY_STEPS_STEP_UTILS_H_
#define EQUIVALENCY_STEPS_STEP_UTILS_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {

// Selected expectation members keyed by name.
using SelectedMembers = absl::flat_hash_map<std::string, const Member*>;

// Runs the selection rules of `options`, in order, on the node of `context`.
std::vector<const Member*> GetMembersFromExpectation(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options);

SelectedMembers GetSelectedMembersByName(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options);

// Returns the subject member chosen by the first matching rule that knows a
// match, or nullptr.
const Member* FindMatchFor(const Member& expectation_member,
                           const EquivalencyValidationContext& context,
                           const EquivalencyOptions& options,
                           AssertionScope& scope);

// Returns true if the expectation type of `context` is `type` or derives
// from it.
bool IsExpectationOfType(const EquivalencyValidationContext& context,
                         const EquivalencyOptions& options, const Type& type);

// Null and type checks of the tabular steps. Returns the subject if both
// sides hold a T and the members have to be compared, nullptr otherwise.
// `label` names the compared kind at the root, e.g. "DataSet".
template <typename T>
const T* CheckSubject(const EquivalencyValidationContext& context,
                      absl::string_view label, AssertionScope& scope) {
  const Value& subject = context.subject();
  const Value& expectation = context.expectation();
  if (expectation.is_null()) {
    if (!subject.is_null()) {
      scope.FailWith(absl::StrCat("Expected {context:", label,
                                  "} value to be null, but found {0}"),
                     subject);
    }
    return nullptr;
  }
  const T* typed_subject = subject.As<T>();
  if (typed_subject != nullptr) {
    return typed_subject;
  }
  if (subject.is_null()) {
    scope.FailWith(absl::StrCat("Expected {context:", label,
                                "} to be non-null, but found null"));
  } else {
    scope.FailWith(absl::StrCat("Expected {context:", label,
                                "} to be of type {0}, but found {1} instead"),
                   expectation.GetType(), subject.GetType());
  }
  return nullptr;
}

// Compares the selected members among `member_names`, in that order. Every
// mismatch is an independent failure.
void CompareScalarMembers(const EquivalencyValidationContext& context,
                          const SelectedMembers& selected,
                          absl::string_view label,
                          absl::Span<const absl::string_view> member_names,
                          AssertionScope& scope);

// Recurses into the member `member_name` if it is selected and a matching
// rule finds its counterpart in the subject.
absl::Status CompareMatchedMember(const EquivalencyValidationContext& context,
                                  const SelectedMembers& selected,
                                  absl::string_view member_name,
                                  EquivalencyValidator& parent,
                                  const EquivalencyOptions& options);

// Item of a collection whose items are identified by name.
struct NamedItem {
  std::string name;
  Value value;
};

// Collection of a tabular object whose items are matched by name, e.g. the
// tables of a DataSet.
struct NamedCollection {
  // Label of the owner in messages, e.g. "DataSet".
  absl::string_view owner_label;
  // Member holding the collection. Items are reported at
  // `<member_name>[<item name>]`.
  absl::string_view member_name;
  // Singular noun of an item, e.g. "table".
  absl::string_view item_noun;
  const Type* item_type;
};

// Matches the items of both sides by name, expectation order first. Reports
// items missing from either side and recurses into items present on both
// sides. Items for which `is_excluded` returns true are skipped.
absl::Status CompareItemsByName(
    const EquivalencyValidationContext& context,
    const NamedCollection& collection,
    const std::vector<NamedItem>& subject_items,
    const std::vector<NamedItem>& expectation_items,
    absl::FunctionRef<bool(absl::string_view)> is_excluded,
    EquivalencyValidator& parent, const EquivalencyOptions& options);

}  // namespace equivalency::steps

#endif  // EQUIVALENCY_STEPS_STEP_UTILS_H_

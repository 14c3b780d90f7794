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
#include "equivalency/matching_rules.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency {
namespace {

const Member* FindSubjectMember(const Value& subject, absl::string_view name) {
  if (!subject.is_object()) {
    return nullptr;
  }
  return subject.GetType().FindMember(name);
}

}  // namespace

const Member* MappedMemberMatchingRule::Match(
    const Member& expectation_member, const Value& subject, const Node& parent,
    const EquivalencyOptions& options, AssertionScope& scope) const {
  if (expectation_member.name() != expectation_member_name_) {
    return nullptr;
  }
  return FindSubjectMember(subject, subject_member_name_);
}

std::string MappedMemberMatchingRule::ToString() const {
  return absl::StrCat("Match member ", expectation_member_name_,
                      " to subject member ", subject_member_name_);
}

const Member* MustMatchByNameRule::Match(const Member& expectation_member,
                                         const Value& subject,
                                         const Node& parent,
                                         const EquivalencyOptions& options,
                                         AssertionScope& scope) const {
  const Member* match = FindSubjectMember(subject, expectation_member.name());
  if (match == nullptr) {
    scope.FailWith(
        "Expectation has {0} that the other object does not have.",
        absl::StrCat("member ",
                     JoinMemberPath(parent.path(), expectation_member.name())));
  }
  return match;
}

std::string MustMatchByNameRule::ToString() const {
  return "Match member by name (or fail)";
}

const Member* TryMatchByNameRule::Match(const Member& expectation_member,
                                        const Value& subject,
                                        const Node& parent,
                                        const EquivalencyOptions& options,
                                        AssertionScope& scope) const {
  return FindSubjectMember(subject, expectation_member.name());
}

std::string TryMatchByNameRule::ToString() const {
  return "Try to match member by name";
}

}  // namespace equivalency

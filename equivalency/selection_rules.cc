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
#include "equivalency/selection_rules.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"

namespace equivalency {
namespace {

bool Contains(const std::vector<const Member*>& members,
              const Member* member) {
  return std::find(members.begin(), members.end(), member) != members.end();
}

MemberPath PathOf(const Node& node, const Member& member) {
  return MemberPath(JoinMemberPath(node.path(), member.name()));
}

}  // namespace

std::vector<const Member*> AllMembersSelectionRule::SelectMembers(
    const Node& node, std::vector<const Member*> selected_members,
    const MemberSelectionContext& context) const {
  const Type& type = context.options.GetExpectationType(
      context.runtime_type, context.compile_time_type);
  for (const Member* member : type.GetMembers()) {
    if (!Contains(selected_members, member)) {
      selected_members.push_back(member);
    }
  }
  return selected_members;
}

std::string AllMembersSelectionRule::ToString() const {
  return "Include all members";
}

std::vector<const Member*> ExcludeMemberByPathSelectionRule::SelectMembers(
    const Node& node, std::vector<const Member*> selected_members,
    const MemberSelectionContext& context) const {
  selected_members.erase(
      std::remove_if(selected_members.begin(), selected_members.end(),
                     [&](const Member* member) {
                       return PathOf(node, *member).IsSameAs(path_);
                     }),
      selected_members.end());
  return selected_members;
}

std::string ExcludeMemberByPathSelectionRule::ToString() const {
  return absl::StrCat("Exclude member ", path_.path());
}

std::vector<const Member*> IncludeMemberByPathSelectionRule::SelectMembers(
    const Node& node, std::vector<const Member*> selected_members,
    const MemberSelectionContext& context) const {
  const Type& type = context.options.GetExpectationType(
      context.runtime_type, context.compile_time_type);
  for (const Member* member : type.GetMembers()) {
    MemberPath member_path = PathOf(node, *member);
    if ((member_path.IsSameAs(path_) || member_path.IsParentOrChildOf(path_)) &&
        !Contains(selected_members, member)) {
      selected_members.push_back(member);
    }
  }
  return selected_members;
}

std::string IncludeMemberByPathSelectionRule::ToString() const {
  return absl::StrCat("Include member ", path_.path());
}

std::vector<const Member*>
ExcludeMemberByPredicateSelectionRule::SelectMembers(
    const Node& node, std::vector<const Member*> selected_members,
    const MemberSelectionContext& context) const {
  selected_members.erase(
      std::remove_if(selected_members.begin(), selected_members.end(),
                     [&](const Member* member) {
                       return predicate_(
                           *member, JoinMemberPath(node.path(), member->name()));
                     }),
      selected_members.end());
  return selected_members;
}

std::string ExcludeMemberByPredicateSelectionRule::ToString() const {
  return absl::StrCat("Exclude members where ", description_);
}

}  // namespace equivalency

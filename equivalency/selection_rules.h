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
#ifndef EQUIVALENCY_SELECTION_RULES_H_
#define EQUIVALENCY_SELECTION_RULES_H_

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"

namespace equivalency {

class EquivalencyOptions;

struct MemberSelectionContext {
  const Type& compile_time_type;
  const Type& runtime_type;
  const EquivalencyOptions& options;
};

// Transforms the list of members compared at a node. Rules are applied in
// registration order, each one receiving the result of the previous ones.
class MemberSelectionRule {
 public:
  virtual ~MemberSelectionRule() = default;

  // Returns true if the rule adds members rather than removing them.
  virtual bool IncludesMembers() const { return false; }

  virtual std::vector<const Member*> SelectMembers(
      const Node& node, std::vector<const Member*> selected_members,
      const MemberSelectionContext& context) const = 0;

  virtual std::string ToString() const = 0;
};

// Selects every member of the expectation type. Installed by default.
class AllMembersSelectionRule final : public MemberSelectionRule {
 public:
  bool IncludesMembers() const override { return true; }
  std::vector<const Member*> SelectMembers(
      const Node& node, std::vector<const Member*> selected_members,
      const MemberSelectionContext& context) const override;
  std::string ToString() const override;
};

class ExcludeMemberByPathSelectionRule final : public MemberSelectionRule {
 public:
  explicit ExcludeMemberByPathSelectionRule(MemberPath path)
      : path_(std::move(path)) {}

  std::vector<const Member*> SelectMembers(
      const Node& node, std::vector<const Member*> selected_members,
      const MemberSelectionContext& context) const override;
  std::string ToString() const override;

 private:
  MemberPath path_;
};

// Adds the members on the included path and the members leading to or
// nested below it.
class IncludeMemberByPathSelectionRule final : public MemberSelectionRule {
 public:
  explicit IncludeMemberByPathSelectionRule(MemberPath path)
      : path_(std::move(path)) {}

  bool IncludesMembers() const override { return true; }
  std::vector<const Member*> SelectMembers(
      const Node& node, std::vector<const Member*> selected_members,
      const MemberSelectionContext& context) const override;
  std::string ToString() const override;

 private:
  MemberPath path_;
};

// Removes the members for which the predicate returns true. The predicate
// receives the member and its full path.
class ExcludeMemberByPredicateSelectionRule final : public MemberSelectionRule {
 public:
  using Predicate =
      std::function<bool(const Member& member, absl::string_view path)>;

  ExcludeMemberByPredicateSelectionRule(Predicate predicate,
                                        std::string description)
      : predicate_(std::move(predicate)),
        description_(std::move(description)) {}

  std::vector<const Member*> SelectMembers(
      const Node& node, std::vector<const Member*> selected_members,
      const MemberSelectionContext& context) const override;
  std::string ToString() const override;

 private:
  Predicate predicate_;
  std::string description_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_SELECTION_RULES_H_

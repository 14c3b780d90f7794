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
#ifndef EQUIVALENCY_MATCHING_RULES_H_
#define EQUIVALENCY_MATCHING_RULES_H_

#include <string>
#include <utility>

#include "equivalency/assertion_scope.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency {

class EquivalencyOptions;

// Finds the subject member that corresponds to a member of the expectation.
// Rules are tried in registration order until one returns a member.
class MemberMatchingRule {
 public:
  virtual ~MemberMatchingRule() = default;

  // Returns nullptr if the rule does not know a match.
  virtual const Member* Match(const Member& expectation_member,
                              const Value& subject, const Node& parent,
                              const EquivalencyOptions& options,
                              AssertionScope& scope) const = 0;

  virtual std::string ToString() const = 0;
};

// Maps an expectation member to a subject member with another name.
class MappedMemberMatchingRule final : public MemberMatchingRule {
 public:
  MappedMemberMatchingRule(std::string expectation_member_name,
                           std::string subject_member_name)
      : expectation_member_name_(std::move(expectation_member_name)),
        subject_member_name_(std::move(subject_member_name)) {}

  const Member* Match(const Member& expectation_member, const Value& subject,
                      const Node& parent, const EquivalencyOptions& options,
                      AssertionScope& scope) const override;
  std::string ToString() const override;

 private:
  std::string expectation_member_name_;
  std::string subject_member_name_;
};

// Matches by name and reports expectation members missing from the subject.
// Installed by default.
class MustMatchByNameRule final : public MemberMatchingRule {
 public:
  const Member* Match(const Member& expectation_member, const Value& subject,
                      const Node& parent, const EquivalencyOptions& options,
                      AssertionScope& scope) const override;
  std::string ToString() const override;
};

// Matches by name and silently ignores missing members.
class TryMatchByNameRule final : public MemberMatchingRule {
 public:
  const Member* Match(const Member& expectation_member, const Value& subject,
                      const Node& parent, const EquivalencyOptions& options,
                      AssertionScope& scope) const override;
  std::string ToString() const override;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_MATCHING_RULES_H_

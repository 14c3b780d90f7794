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
#include "equivalency/validation_context.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {
namespace {

bool IsSameObject(const Value& subject, const Value& expectation) {
  return subject.is_object() && subject.object() == expectation.object();
}

}  // namespace

Node Node::ChildMember(absl::string_view name) const {
  std::string path = JoinMemberPath(path_, name);
  std::string description = absl::StrCat("member ", path);
  return Node(std::move(path), std::move(description), depth_ + 1);
}

Node Node::ChildItem(absl::string_view key) const {
  std::string path = JoinItemPath(path_, key);
  std::string description = absl::StrCat("item ", path);
  return Node(std::move(path), std::move(description), depth_ + 1);
}

EquivalencyValidationContext::EquivalencyValidationContext(
    Node node, Value subject, Value expectation, const Type& compile_time_type)
    : node_(std::move(node)),
      subject_(std::move(subject)),
      expectation_(std::move(expectation)),
      compile_time_type_(&compile_time_type),
      runtime_type_(expectation_.is_null() ? &compile_time_type
                                           : &expectation_.GetType()) {}

std::optional<EquivalencyValidationContext>
EquivalencyValidationContext::AsNestedMember(
    const Member& expectation_member, const Member& subject_member) const {
  return AsNestedMember(expectation_member.name(),
                        subject_member.GetValue(subject_),
                        expectation_member.GetValue(expectation_),
                        expectation_member.value_type());
}

std::optional<EquivalencyValidationContext>
EquivalencyValidationContext::AsNestedMember(
    absl::string_view name, Value subject, Value expectation,
    const Type& compile_time_type) const {
  if (IsSameObject(subject, expectation)) {
    return std::nullopt;
  }
  return EquivalencyValidationContext(node_.ChildMember(name),
                                      std::move(subject),
                                      std::move(expectation),
                                      compile_time_type);
}

std::optional<EquivalencyValidationContext>
EquivalencyValidationContext::AsCollectionItem(absl::string_view key,
                                               Value subject_item,
                                               Value expectation_item,
                                               const Type* item_type) const {
  if (IsSameObject(subject_item, expectation_item)) {
    return std::nullopt;
  }
  if (item_type == nullptr) {
    item_type = runtime_type_->element_type() != nullptr
                    ? runtime_type_->element_type()
                    : &ObjectType();
  }
  return EquivalencyValidationContext(node_.ChildItem(key),
                                      std::move(subject_item),
                                      std::move(expectation_item), *item_type);
}

std::optional<EquivalencyValidationContext>
EquivalencyValidationContext::AsCollectionItem(size_t index,
                                               Value subject_item,
                                               Value expectation_item) const {
  return AsCollectionItem(absl::StrCat(index), std::move(subject_item),
                          std::move(expectation_item));
}

}  // namespace equivalency

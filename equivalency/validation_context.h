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
#ifndef EQUIVALENCY_VALIDATION_CONTEXT_H_
#define EQUIVALENCY_VALIDATION_CONTEXT_H_

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

// Position of a compared pair inside the graph.
class Node {
 public:
  // The root of a traversal.
  Node() = default;

  // `parent.name`, described as "member <path>".
  Node ChildMember(absl::string_view name) const;

  // `parent[key]`, described as "item <path>".
  Node ChildItem(absl::string_view key) const;

  // Dotted path, empty for the root.
  const std::string& path() const { return path_; }
  // Description used in failure messages, empty for the root.
  const std::string& description() const { return description_; }
  // Number of members and items between the root and this node.
  int depth() const { return depth_; }
  bool is_root() const { return depth_ == 0; }

  MemberPath AsMemberPath() const { return MemberPath(path_); }

 private:
  Node(std::string path, std::string description, int depth)
      : path_(std::move(path)),
        description_(std::move(description)),
        depth_(depth) {}

  std::string path_;
  std::string description_;
  int depth_ = 0;
};

// Immutable state of one compared (subject, expectation) pair.
class EquivalencyValidationContext {
 public:
  EquivalencyValidationContext(Node node, Value subject, Value expectation,
                               const Type& compile_time_type);

  const Node& node() const { return node_; }
  const Value& subject() const { return subject_; }
  const Value& expectation() const { return expectation_; }

  // Declared type of the compared location.
  const Type& compile_time_type() const { return *compile_time_type_; }
  // Type of the expectation, or the declared type if the expectation is null.
  const Type& runtime_type() const { return *runtime_type_; }

  // Context for a member of both sides. Returns std::nullopt if subject and
  // expectation refer to the same object, in which case there is nothing to
  // compare.
  std::optional<EquivalencyValidationContext> AsNestedMember(
      const Member& expectation_member, const Member& subject_member) const;

  // Same for a member without a descriptor, e.g. a collection owned by a
  // tabular object.
  std::optional<EquivalencyValidationContext> AsNestedMember(
      absl::string_view name, Value subject, Value expectation,
      const Type& compile_time_type) const;

  // Context for an item of a collection, with path `parent[key]`. The
  // compile time type is `item_type` or, if nullptr, the element type of the
  // collection type.
  std::optional<EquivalencyValidationContext> AsCollectionItem(
      absl::string_view key, Value subject_item, Value expectation_item,
      const Type* item_type = nullptr) const;
  std::optional<EquivalencyValidationContext> AsCollectionItem(
      size_t index, Value subject_item, Value expectation_item) const;

 private:
  Node node_;
  Value subject_;
  Value expectation_;
  const Type* compile_time_type_;
  const Type* runtime_type_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_VALIDATION_CONTEXT_H_

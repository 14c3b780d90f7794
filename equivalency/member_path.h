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
#ifndef EQUIVALENCY_MEMBER_PATH_H_
#define EQUIVALENCY_MEMBER_PATH_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "equivalency/type.h"

namespace equivalency {

// Location of a member inside an object graph, e.g. `Parent.Child[2].Name`.
//
// The path is normalized on construction (`.[` becomes `[`) and split into
// segments (`Parent`, `Child`, `[2]`, `Name`). A `[]` segment matches any
// index segment in the comparisons below.
class MemberPath {
 public:
  // Path without type information. Both types are the root object type.
  explicit MemberPath(absl::string_view path)
      : MemberPath(ObjectType(), ObjectType(), path) {}

  MemberPath(const Type& reflected_type, const Type& declaring_type,
             absl::string_view path);

  // Type the path was resolved against.
  const Type& reflected_type() const { return *reflected_type_; }
  // Type declaring the outermost member of the path.
  const Type& declaring_type() const { return *declaring_type_; }

  const std::string& path() const { return path_; }
  const std::vector<std::string>& segments() const { return segments_; }
  bool empty() const { return segments_.empty(); }

  // Returns true if both paths point to the same location.
  bool IsSameAs(const MemberPath& other) const;

  // Returns true if `other` is nested below this path.
  bool IsParentOf(const MemberPath& other) const;

  // Returns true if this path is nested below `other`.
  bool IsChildOf(const MemberPath& other) const {
    return other.IsParentOf(*this);
  }

  bool IsParentOrChildOf(const MemberPath& other) const {
    return IsParentOf(other) || IsChildOf(other);
  }

  // Returns the path of `member_name` nested below this path.
  MemberPath Child(absl::string_view member_name) const;

  bool operator==(const MemberPath& other) const {
    return declaring_type_ == other.declaring_type_ && path_ == other.path_;
  }
  bool operator!=(const MemberPath& other) const { return !(*this == other); }

  template <typename H>
  friend H AbslHashValue(H h, const MemberPath& path) {
    return H::combine(std::move(h), path.declaring_type_, path.path_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const MemberPath& path) {
    sink.Append(path.path_);
  }

 private:
  const Type* reflected_type_;
  const Type* declaring_type_;
  std::string path_;
  std::vector<std::string> segments_;
};

// Joins a parent path and a member name: `Parent.Name`, or `Name` at the root.
std::string JoinMemberPath(absl::string_view parent, absl::string_view name);

// Appends an index or key segment: `Parent[key]`.
std::string JoinItemPath(absl::string_view parent, absl::string_view key);

}  // namespace equivalency

#endif  // EQUIVALENCY_MEMBER_PATH_H_

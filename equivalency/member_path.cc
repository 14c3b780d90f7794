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
#include "equivalency/member_path.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "equivalency/type.h"

namespace equivalency {
namespace {

constexpr absl::string_view kAnyIndex = "[]";

std::vector<std::string> SplitSegments(absl::string_view path) {
  std::vector<std::string> segments;
  std::string current;
  auto flush = [&] {
    if (!current.empty()) {
      segments.push_back(std::move(current));
      current.clear();
    }
  };
  // Keys such as table or column names may contain dots.
  bool in_brackets = false;
  for (char c : path) {
    if (in_brackets) {
      current.push_back(c);
      if (c == ']') {
        in_brackets = false;
        flush();
      }
    } else if (c == '.') {
      flush();
    } else if (c == '[') {
      flush();
      current.push_back(c);
      in_brackets = true;
    } else {
      current.push_back(c);
    }
  }
  flush();
  return segments;
}

bool IsIndex(absl::string_view segment) {
  return !segment.empty() && segment.front() == '[';
}

bool SegmentsMatch(absl::string_view a, absl::string_view b) {
  if (a == b) {
    return true;
  }
  return IsIndex(a) && IsIndex(b) && (a == kAnyIndex || b == kAnyIndex);
}

// Returns true if `prefix` matches the first segments of `segments`.
bool StartsWith(const std::vector<std::string>& segments,
                const std::vector<std::string>& prefix) {
  if (prefix.size() > segments.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (!SegmentsMatch(segments[i], prefix[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

MemberPath::MemberPath(const Type& reflected_type, const Type& declaring_type,
                       absl::string_view path)
    : reflected_type_(&reflected_type),
      declaring_type_(&declaring_type),
      path_(absl::StrReplaceAll(path, {{".[", "["}})),
      segments_(SplitSegments(path_)) {}

bool MemberPath::IsSameAs(const MemberPath& other) const {
  return segments_.size() == other.segments_.size() &&
         StartsWith(segments_, other.segments_);
}

bool MemberPath::IsParentOf(const MemberPath& other) const {
  return segments_.size() < other.segments_.size() &&
         StartsWith(other.segments_, segments_);
}

MemberPath MemberPath::Child(absl::string_view member_name) const {
  return MemberPath(*reflected_type_, *declaring_type_,
                    JoinMemberPath(path_, member_name));
}

std::string JoinMemberPath(absl::string_view parent, absl::string_view name) {
  if (parent.empty()) {
    return std::string(name);
  }
  return absl::StrCat(parent, ".", name);
}

std::string JoinItemPath(absl::string_view parent, absl::string_view key) {
  return absl::StrCat(parent, "[", key, "]");
}

}  // namespace equivalency

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
#include "equivalency/record.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

Record::Record(const Type& type) : type_(&type) {
  CHECK(type.kind() == TypeKind::kObject)
      << "records require an object type, got " << type.name();
  for (const Member* member : type.GetMembers()) {
    CHECK(member->is_field())
        << "records require field members, but " << member->name() << " of "
        << type.name() << " is declared by " << member->declaring_type().name()
        << " with a custom getter";
  }
}

Record& Record::Set(absl::string_view name, Value value) {
  CHECK(type_->FindMember(name) != nullptr)
      << type_->name() << " has no member " << name;
  fields_[std::string(name)] = std::move(value);
  return *this;
}

Value Record::Get(absl::string_view name) const {
  if (auto it = fields_.find(name); it != fields_.end()) {
    return it->second;
  }
  return Value();
}

List::List(const Type& type, std::vector<Value> items)
    : type_(&type), items_(std::move(items)) {
  CHECK(type.kind() == TypeKind::kList)
      << "lists require a list type, got " << type.name();
}

std::string List::DebugString() const {
  return absl::StrCat(type_->name(), "[", items_.size(), "]");
}

Dict::Dict(const Type& type) : type_(&type) {
  CHECK(type.kind() == TypeKind::kDict)
      << "dicts require a dict type, got " << type.name();
}

std::string Dict::DebugString() const {
  return absl::StrCat(type_->name(), "{", entries_.size(), "}");
}

Dict& Dict::Set(Value key, Value value) {
  CHECK(!key.is_null() && !key.is_object())
      << "dict keys must be scalars, got " << key;
  auto [it, inserted] = index_.emplace(key, entries_.size());
  if (inserted) {
    entries_.emplace_back(std::move(key), std::move(value));
  } else {
    entries_[it->second].second = std::move(value);
  }
  return *this;
}

const Value* Dict::Find(const Value& key) const {
  if (auto it = index_.find(key); it != index_.end()) {
    return &entries_[it->second].second;
  }
  return nullptr;
}

}  // namespace equivalency

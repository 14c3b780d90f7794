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
#include "equivalency/type.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "equivalency/record.h"
#include "equivalency/value.h"

namespace equivalency {

std::unique_ptr<Type> CreatePrimitiveType(std::string name, TypeKind kind,
                                          const Type* base) {
  return std::unique_ptr<Type>(new Type(std::move(name), kind, base));
}

#define EQUIVALENCY_DEFINE_BUILTIN_TYPE(fn, type_name, kind, base)          \
  const Type& fn() {                                                        \
    static const absl::NoDestructor<std::unique_ptr<Type>> type(            \
        CreatePrimitiveType(type_name, kind, base));                        \
    return **type;                                                          \
  }

EQUIVALENCY_DEFINE_BUILTIN_TYPE(NullType, "null", TypeKind::kNull, nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(BoolType, "bool", TypeKind::kBool, nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(Int64Type, "int64", TypeKind::kInt64, nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(DoubleType, "double", TypeKind::kDouble,
                                nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(StringType, "string", TypeKind::kString,
                                nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(ObjectType, "Object", TypeKind::kObject,
                                nullptr)
EQUIVALENCY_DEFINE_BUILTIN_TYPE(ListType, "List", TypeKind::kList,
                                &ObjectType())
EQUIVALENCY_DEFINE_BUILTIN_TYPE(DictType, "Dict", TypeKind::kDict,
                                &ObjectType())

#undef EQUIVALENCY_DEFINE_BUILTIN_TYPE

Value Member::GetValue(const Value& instance) const {
  const Object* object = instance.object();
  if (object == nullptr ||
      !declaring_type_->IsAssignableFrom(object->GetType())) {
    return Value();
  }
  return getter_(*object);
}

bool Type::IsAssignableFrom(const Type& other) const {
  // Every value can be stored in an Object slot.
  if (this == &ObjectType()) {
    return true;
  }
  for (const Type* t = &other; t != nullptr; t = t->base_) {
    if (t == this) {
      return true;
    }
  }
  return false;
}

std::vector<const Member*> Type::GetMembers() const {
  std::vector<const Member*> result;
  if (base_ != nullptr) {
    result = base_->GetMembers();
  }
  for (const auto& member : members_) {
    result.push_back(member.get());
  }
  return result;
}

const Member* Type::FindMember(absl::string_view name) const {
  for (const Type* t = this; t != nullptr; t = t->base_) {
    for (const auto& member : t->members_) {
      if (member->name() == name) {
        return member.get();
      }
    }
  }
  return nullptr;
}

Type::Builder::Builder(std::string name)
    : name_(std::move(name)), base_(&ObjectType()) {}

Type::Builder& Type::Builder::WithBase(const Type& base) {
  CHECK(base.kind() == TypeKind::kObject)
      << name_ << " cannot derive from " << base.name();
  base_ = &base;
  return *this;
}

Type::Builder& Type::Builder::AddMember(std::string name,
                                        const Type& value_type,
                                        Member::Getter getter) {
  members_.push_back(
      {std::move(name), &value_type, std::move(getter), /*is_field=*/false});
  return *this;
}

Type::Builder& Type::Builder::AddField(std::string name,
                                       const Type& value_type) {
  Member::Getter getter = [name](const Object& object) -> Value {
    if (const auto* record = dynamic_cast<const Record*>(&object)) {
      return record->Get(name);
    }
    return Value();
  };
  members_.push_back(
      {std::move(name), &value_type, std::move(getter), /*is_field=*/true});
  return *this;
}

std::unique_ptr<const Type> Type::Builder::Build() {
  auto type =
      std::unique_ptr<Type>(new Type(name_, TypeKind::kObject, base_));
  absl::flat_hash_set<std::string> names;
  for (const Member* inherited : base_->GetMembers()) {
    names.insert(inherited->name());
  }
  for (PendingMember& member : members_) {
    CHECK(names.insert(member.name).second)
        << name_ << " declares member " << member.name << " twice";
    type->members_.push_back(std::make_unique<Member>(
        std::move(member.name), type.get(), member.value_type,
        std::move(member.getter), member.is_field));
  }
  return type;
}

const Type& ListOf(const Type& element_type) {
  static absl::NoDestructor<absl::Mutex> mutex;
  static absl::NoDestructor<
      absl::flat_hash_map<const Type*, std::unique_ptr<Type>>>
      types;
  absl::MutexLock lock(mutex.get());
  auto& type = (*types)[&element_type];
  if (type == nullptr) {
    type = std::unique_ptr<Type>(new Type(
        absl::StrCat("List<", element_type.name(), ">"), TypeKind::kList,
        &ListType()));
    type->element_type_ = &element_type;
  }
  return *type;
}

const Type& DictOf(const Type& key_type, const Type& value_type) {
  static absl::NoDestructor<absl::Mutex> mutex;
  static absl::NoDestructor<absl::flat_hash_map<
      std::pair<const Type*, const Type*>, std::unique_ptr<Type>>>
      types;
  absl::MutexLock lock(mutex.get());
  auto& type = (*types)[std::make_pair(&key_type, &value_type)];
  if (type == nullptr) {
    type = std::unique_ptr<Type>(
        new Type(absl::StrCat("Dict<", key_type.name(), ", ",
                              value_type.name(), ">"),
                 TypeKind::kDict, &DictType()));
    type->key_type_ = &key_type;
    type->element_type_ = &value_type;
  }
  return *type;
}

}  // namespace equivalency

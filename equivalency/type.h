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
#ifndef EQUIVALENCY_TYPE_H_
#define EQUIVALENCY_TYPE_H_

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "equivalency/value.h"

namespace equivalency {

enum class TypeKind {
  kNull,
  kBool,
  kInt64,
  kDouble,
  kString,
  kObject,
  kList,
  kDict,
};

class Type;

// Describes one member of a Type: its name, the type that declares it, the
// static type of its values and how to read it from an instance.
class Member {
 public:
  using Getter = std::function<Value(const Object&)>;

  Member(std::string name, const Type* declaring_type,
         const Type* value_type, Getter getter, bool is_field = false)
      : name_(std::move(name)),
        declaring_type_(declaring_type),
        value_type_(value_type),
        getter_(std::move(getter)),
        is_field_(is_field) {}

  Member(const Member&) = delete;
  Member& operator=(const Member&) = delete;

  const std::string& name() const { return name_; }
  const Type& declaring_type() const { return *declaring_type_; }
  const Type& value_type() const { return *value_type_; }
  // True for members stored in Record fields.
  bool is_field() const { return is_field_; }

  // Reads the member from `instance`. Returns null if `instance` is not an
  // object of the declaring type.
  Value GetValue(const Value& instance) const;

 private:
  std::string name_;
  const Type* declaring_type_;
  const Type* value_type_;
  Getter getter_;
  bool is_field_;
};

// Runtime type descriptor. Types are registered once (see Type::Builder) and
// are never destroyed while values of the type are alive.
class Type {
 public:
  class Builder;

  Type(const Type&) = delete;
  Type& operator=(const Type&) = delete;

  const std::string& name() const { return name_; }
  TypeKind kind() const { return kind_; }
  const Type* base() const { return base_; }

  // Item type of list types, value type of dict types, nullptr otherwise.
  const Type* element_type() const { return element_type_; }
  // Key type of dict types, nullptr otherwise.
  const Type* key_type() const { return key_type_; }

  bool is_primitive() const {
    return kind_ != TypeKind::kObject && kind_ != TypeKind::kList &&
           kind_ != TypeKind::kDict;
  }

  // Returns true if `other` is this type or derives from it.
  bool IsAssignableFrom(const Type& other) const;

  // Members declared on this type and all of its bases, base members first.
  std::vector<const Member*> GetMembers() const;

  // Finds a member declared on this type or on one of its bases.
  const Member* FindMember(absl::string_view name) const;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Type& type) {
    sink.Append(type.name());
  }

 private:
  Type(std::string name, TypeKind kind, const Type* base)
      : name_(std::move(name)), kind_(kind), base_(base) {}

  friend const Type& ListOf(const Type& element_type);
  friend const Type& DictOf(const Type& key_type, const Type& value_type);
  friend std::unique_ptr<Type> CreatePrimitiveType(std::string name,
                                                   TypeKind kind,
                                                   const Type* base);

  std::string name_;
  TypeKind kind_;
  const Type* base_;
  const Type* element_type_ = nullptr;
  const Type* key_type_ = nullptr;
  std::vector<std::unique_ptr<Member>> members_;
};

// Registers an object type.
//
// Example:
//   static const absl::NoDestructor<std::unique_ptr<const Type>> kPerson(
//       Type::Builder("Person")
//           .AddField("Name", StringType())
//           .AddField("Age", Int64Type())
//           .Build());
//
// Fields are stored in Record instances. Members with custom getters are for
// Object subclasses of the declaring type; Record rejects types that have
// them.
class Type::Builder {
 public:
  explicit Builder(std::string name);

  Builder& WithBase(const Type& base);

  // Adds a member read by `getter`. The getter is only ever called with
  // instances of the type being built (or of its subtypes).
  Builder& AddMember(std::string name, const Type& value_type,
                     Member::Getter getter);

  // Adds a member stored in Record instances.
  Builder& AddField(std::string name, const Type& value_type);

  // Creates the type. The builder must not be used afterwards.
  std::unique_ptr<const Type> Build();

 private:
  struct PendingMember {
    std::string name;
    const Type* value_type;
    Member::Getter getter;
    bool is_field;
  };

  std::string name_;
  const Type* base_;
  std::vector<PendingMember> members_;
};

const Type& NullType();
const Type& BoolType();
const Type& Int64Type();
const Type& DoubleType();
const Type& StringType();
// Root of all object types.
const Type& ObjectType();
// Untyped list and dict, bases of all ListOf / DictOf types.
const Type& ListType();
const Type& DictType();

// Returns the interned list type with the given item type.
const Type& ListOf(const Type& element_type);

// Returns the interned dict type with the given key and value types.
const Type& DictOf(const Type& key_type, const Type& value_type);

}  // namespace equivalency

#endif  // EQUIVALENCY_TYPE_H_

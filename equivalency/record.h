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
#ifndef EQUIVALENCY_RECORD_H_
#define EQUIVALENCY_RECORD_H_

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

// Generic structured object. Stores the values of the fields declared with
// Type::Builder::AddField.
class Record : public Object {
 public:
  explicit Record(const Type& type);

  static std::shared_ptr<Record> Create(const Type& type) {
    return std::make_shared<Record>(type);
  }

  const Type& GetType() const override { return *type_; }

  // Sets a field. The field must be declared on the record type.
  Record& Set(absl::string_view name, Value value);

  // Returns the value of the field or null if it was never set.
  Value Get(absl::string_view name) const;

 private:
  const Type* type_;
  absl::flat_hash_map<std::string, Value> fields_;
};

// Ordered sequence of values.
class List : public Object {
 public:
  explicit List(std::vector<Value> items = {})
      : List(ListType(), std::move(items)) {}
  // `type` must be a list type.
  List(const Type& type, std::vector<Value> items);

  static std::shared_ptr<List> Create(std::vector<Value> items) {
    return std::make_shared<List>(std::move(items));
  }

  const Type& GetType() const override { return *type_; }
  std::string DebugString() const override;

  const std::vector<Value>& items() const { return items_; }
  size_t size() const { return items_.size(); }

  void Append(Value item) { items_.push_back(std::move(item)); }

 private:
  const Type* type_;
  std::vector<Value> items_;
};

// Map from scalar keys to values. Keeps insertion order.
class Dict : public Object {
 public:
  using Entry = std::pair<Value, Value>;

  Dict() : Dict(DictType()) {}
  // `type` must be a dict type.
  explicit Dict(const Type& type);

  static std::shared_ptr<Dict> Create() { return std::make_shared<Dict>(); }

  const Type& GetType() const override { return *type_; }
  std::string DebugString() const override;

  // Inserts or replaces the value of `key`. Keys must not be objects or null.
  Dict& Set(Value key, Value value);

  // Returns nullptr if the key is not present.
  const Value* Find(const Value& key) const;

  const std::vector<Entry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }

 private:
  const Type* type_;
  std::vector<Entry> entries_;
  absl::flat_hash_map<Value, size_t> index_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_RECORD_H_

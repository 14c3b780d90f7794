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
#include "equivalency/data/data_relation.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/strings/str_cat.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {
namespace {

const DataRelation& AsRelation(const Object& object) {
  return static_cast<const DataRelation&>(object);
}

Value Names(const std::vector<std::string>& names) {
  std::vector<Value> values;
  values.reserve(names.size());
  for (const std::string& name : names) {
    values.emplace_back(name);
  }
  return Value(std::make_shared<List>(ListOf(StringType()), std::move(values)));
}

}  // namespace

const Type& DataRelationType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("DataRelation")
          .AddMember(
              "RelationName", StringType(),
              [](const Object& o) { return Value(AsRelation(o).name()); })
          .AddMember("ParentTable", StringType(),
                     [](const Object& o) {
                       return Value(AsRelation(o).parent_table());
                     })
          .AddMember("ChildTable", StringType(),
                     [](const Object& o) {
                       return Value(AsRelation(o).child_table());
                     })
          .AddMember("ParentColumns", ListOf(StringType()),
                     [](const Object& o) {
                       return Names(AsRelation(o).parent_columns());
                     })
          .AddMember("ChildColumns", ListOf(StringType()),
                     [](const Object& o) {
                       return Names(AsRelation(o).child_columns());
                     })
          .AddMember(
              "Nested", BoolType(),
              [](const Object& o) { return Value(AsRelation(o).nested()); })
          .AddMember("ExtendedProperties", DictOf(StringType(), ObjectType()),
                     [](const Object& o) {
                       return Value(AsRelation(o).extended_properties());
                     })
          .Build());
  return **type;
}

std::string DataRelation::DebugString() const {
  return absl::StrCat("DataRelation(", name_, ": ", parent_table_, " -> ",
                      child_table_, ")");
}

}  // namespace equivalency::data

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
#include "equivalency/data/data_column.h"

#include <memory>
#include <string>

#include "absl/base/no_destructor.h"
#include "absl/strings/str_cat.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {
namespace {

const DataColumn& AsColumn(const Object& object) {
  return static_cast<const DataColumn&>(object);
}

}  // namespace

const Type& DataColumnType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("DataColumn")
          .AddMember("ColumnName", StringType(),
                     [](const Object& o) { return Value(AsColumn(o).name()); })
          .AddMember(
              "Caption", StringType(),
              [](const Object& o) { return Value(AsColumn(o).caption()); })
          .AddMember("DataType", StringType(),
                     [](const Object& o) {
                       return Value(AsColumn(o).data_type().name());
                     })
          .AddMember("AllowDBNull", BoolType(),
                     [](const Object& o) {
                       return Value(AsColumn(o).allow_db_null());
                     })
          .AddMember("AutoIncrement", BoolType(),
                     [](const Object& o) {
                       return Value(AsColumn(o).auto_increment());
                     })
          .AddMember(
              "MaxLength", Int64Type(),
              [](const Object& o) { return Value(AsColumn(o).max_length()); })
          .AddMember(
              "ReadOnly", BoolType(),
              [](const Object& o) { return Value(AsColumn(o).read_only()); })
          .AddMember("Unique", BoolType(),
                     [](const Object& o) { return Value(AsColumn(o).unique()); })
          .AddMember("ExtendedProperties", DictOf(StringType(), ObjectType()),
                     [](const Object& o) {
                       return Value(AsColumn(o).extended_properties());
                     })
          .Build());
  return **type;
}

std::string DataColumn::DebugString() const {
  return absl::StrCat("DataColumn(", name_, ": ", data_type_->name(), ")");
}

bool DataColumn::Accepts(const Value& value) const {
  if (value.is_null()) {
    return allow_db_null_;
  }
  return data_type_->IsAssignableFrom(value.GetType());
}

}  // namespace equivalency::data

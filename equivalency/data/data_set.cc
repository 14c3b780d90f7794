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
#include "equivalency/data/data_set.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/data/data_relation.h"
#include "equivalency/data/data_table.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {
namespace {

const DataSet& AsDataSet(const Object& object) {
  return static_cast<const DataSet&>(object);
}

template <typename T>
Value ListValue(const Type& item_type,
                const std::vector<std::shared_ptr<T>>& items) {
  std::vector<Value> values;
  values.reserve(items.size());
  for (const auto& item : items) {
    values.emplace_back(item);
  }
  return Value(std::make_shared<List>(ListOf(item_type), std::move(values)));
}

absl::Status CheckColumnsExist(const DataTable& table,
                               const std::vector<std::string>& columns,
                               absl::string_view relation) {
  for (const std::string& column : columns) {
    if (table.FindColumn(column) == nullptr) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "relation %s references unknown column %s.%s", relation,
          table.name(), column));
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::string_view SchemaSerializationModeName(SchemaSerializationMode mode) {
  switch (mode) {
    case SchemaSerializationMode::kIncludeSchema:
      return "IncludeSchema";
    case SchemaSerializationMode::kExcludeSchema:
      return "ExcludeSchema";
  }
  return "Unknown";
}

const Type& DataSetType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("DataSet")
          .AddMember(
              "DataSetName", StringType(),
              [](const Object& o) { return Value(AsDataSet(o).name()); })
          .AddMember("CaseSensitive", BoolType(),
                     [](const Object& o) {
                       return Value(AsDataSet(o).case_sensitive());
                     })
          .AddMember("EnforceConstraints", BoolType(),
                     [](const Object& o) {
                       return Value(AsDataSet(o).enforce_constraints());
                     })
          .AddMember(
              "HasErrors", BoolType(),
              [](const Object& o) { return Value(AsDataSet(o).has_errors()); })
          .AddMember(
              "Locale", StringType(),
              [](const Object& o) { return Value(AsDataSet(o).locale()); })
          .AddMember("Namespace", StringType(),
                     [](const Object& o) {
                       return Value(AsDataSet(o).namespace_uri());
                     })
          .AddMember(
              "Prefix", StringType(),
              [](const Object& o) { return Value(AsDataSet(o).prefix()); })
          .AddMember("RemotingFormat", StringType(),
                     [](const Object& o) {
                       return Value(SerializationFormatName(
                           AsDataSet(o).remoting_format()));
                     })
          .AddMember("SchemaSerializationMode", StringType(),
                     [](const Object& o) {
                       return Value(SchemaSerializationModeName(
                           AsDataSet(o).schema_serialization_mode()));
                     })
          .AddMember("ExtendedProperties", DictOf(StringType(), ObjectType()),
                     [](const Object& o) {
                       return Value(AsDataSet(o).extended_properties());
                     })
          .AddMember("Relations", ListOf(DataRelationType()),
                     [](const Object& o) {
                       return ListValue(DataRelationType(),
                                        AsDataSet(o).relations());
                     })
          .AddMember("Tables", ListOf(DataTableType()),
                     [](const Object& o) {
                       return ListValue(DataTableType(), AsDataSet(o).tables());
                     })
          .Build());
  return **type;
}

DataSet::DataSet(std::string name, const Type& type)
    : name_(std::move(name)),
      type_(&type),
      extended_properties_(std::make_shared<Dict>()) {
  CHECK(DataSetType().IsAssignableFrom(type))
      << type.name() << " is not a DataSet type";
}

std::string DataSet::DebugString() const {
  return absl::StrCat(type_->name(), "(", name_, ")");
}

bool DataSet::has_errors() const {
  for (const auto& table : tables_) {
    if (table->has_errors()) {
      return true;
    }
  }
  return false;
}

const DataTable* DataSet::FindTable(absl::string_view name) const {
  for (const auto& table : tables_) {
    if (table->name() == name) {
      return table.get();
    }
  }
  return nullptr;
}

absl::Status DataSet::AddTable(std::shared_ptr<DataTable> table) {
  DCHECK(table != nullptr);
  if (FindTable(table->name()) != nullptr) {
    return absl::AlreadyExistsError(absl::StrFormat(
        "a table named %s already belongs to DataSet %s", table->name(),
        name_));
  }
  tables_.push_back(std::move(table));
  return absl::OkStatus();
}

absl::Status DataSet::AddRelation(std::shared_ptr<DataRelation> relation) {
  DCHECK(relation != nullptr);
  for (const auto& existing : relations_) {
    if (existing->name() == relation->name()) {
      return absl::AlreadyExistsError(absl::StrFormat(
          "a relation named %s already belongs to DataSet %s",
          relation->name(), name_));
    }
  }
  const DataTable* parent = FindTable(relation->parent_table());
  const DataTable* child = FindTable(relation->child_table());
  if (parent == nullptr || child == nullptr) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "relation %s references a table that is not part of DataSet %s",
        relation->name(), name_));
  }
  if (relation->parent_columns().empty() ||
      relation->parent_columns().size() != relation->child_columns().size()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "relation %s must link the same non-zero number of parent and child "
        "columns",
        relation->name()));
  }
  RETURN_IF_ERROR(CheckColumnsExist(*parent, relation->parent_columns(),
                                    relation->name()));
  RETURN_IF_ERROR(
      CheckColumnsExist(*child, relation->child_columns(), relation->name()));
  relations_.push_back(std::move(relation));
  return absl::OkStatus();
}

}  // namespace equivalency::data

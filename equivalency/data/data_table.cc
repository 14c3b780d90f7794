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
#include "equivalency/data/data_table.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "equivalency/data/data_column.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {
namespace {

const DataRow& AsRow(const Object& object) {
  return static_cast<const DataRow&>(object);
}

const DataTable& AsTable(const Object& object) {
  return static_cast<const DataTable&>(object);
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

Value StringListValue(const std::vector<std::string>& items) {
  std::vector<Value> values;
  values.reserve(items.size());
  for (const std::string& item : items) {
    values.emplace_back(item);
  }
  return Value(std::make_shared<List>(ListOf(StringType()), std::move(values)));
}

}  // namespace

absl::string_view RowStateName(RowState state) {
  switch (state) {
    case RowState::kDetached:
      return "Detached";
    case RowState::kUnchanged:
      return "Unchanged";
    case RowState::kAdded:
      return "Added";
    case RowState::kDeleted:
      return "Deleted";
    case RowState::kModified:
      return "Modified";
  }
  return "Unknown";
}

absl::string_view SerializationFormatName(SerializationFormat format) {
  switch (format) {
    case SerializationFormat::kXml:
      return "Xml";
    case SerializationFormat::kBinary:
      return "Binary";
  }
  return "Unknown";
}

const Type& DataRowType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("DataRow")
          .AddMember("RowState", StringType(),
                     [](const Object& o) {
                       return Value(RowStateName(AsRow(o).row_state()));
                     })
          .AddMember(
              "HasErrors", BoolType(),
              [](const Object& o) { return Value(AsRow(o).has_errors()); })
          .AddMember(
              "RowError", StringType(),
              [](const Object& o) { return Value(AsRow(o).row_error()); })
          .Build());
  return **type;
}

const Type& DataTableType() {
  static const absl::NoDestructor<std::unique_ptr<const Type>> type(
      Type::Builder("DataTable")
          .AddMember("TableName", StringType(),
                     [](const Object& o) { return Value(AsTable(o).name()); })
          .AddMember("CaseSensitive", BoolType(),
                     [](const Object& o) {
                       return Value(AsTable(o).case_sensitive());
                     })
          .AddMember("DisplayExpression", StringType(),
                     [](const Object& o) {
                       return Value(AsTable(o).display_expression());
                     })
          .AddMember(
              "HasErrors", BoolType(),
              [](const Object& o) { return Value(AsTable(o).has_errors()); })
          .AddMember(
              "Locale", StringType(),
              [](const Object& o) { return Value(AsTable(o).locale()); })
          .AddMember("Namespace", StringType(),
                     [](const Object& o) {
                       return Value(AsTable(o).namespace_uri());
                     })
          .AddMember(
              "Prefix", StringType(),
              [](const Object& o) { return Value(AsTable(o).prefix()); })
          .AddMember("RemotingFormat", StringType(),
                     [](const Object& o) {
                       return Value(SerializationFormatName(
                           AsTable(o).remoting_format()));
                     })
          .AddMember("ExtendedProperties", DictOf(StringType(), ObjectType()),
                     [](const Object& o) {
                       return Value(AsTable(o).extended_properties());
                     })
          .AddMember("Columns", ListOf(DataColumnType()),
                     [](const Object& o) {
                       return ListValue(DataColumnType(),
                                        AsTable(o).columns());
                     })
          .AddMember("PrimaryKey", ListOf(StringType()),
                     [](const Object& o) {
                       return StringListValue(AsTable(o).primary_key());
                     })
          .AddMember("Rows", ListOf(DataRowType()),
                     [](const Object& o) {
                       return ListValue(DataRowType(), AsTable(o).rows());
                     })
          .Build());
  return **type;
}

std::string DataRow::DebugString() const {
  return absl::StrCat("DataRow(", table_name_, ")");
}

const Value* DataRow::Find(absl::string_view column_name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i]->name() == column_name) {
      return &values_[i];
    }
  }
  return nullptr;
}

std::string DataTable::DebugString() const {
  return absl::StrCat("DataTable(", name_, ")");
}

bool DataTable::has_errors() const {
  for (const auto& row : rows_) {
    if (row->has_errors()) {
      return true;
    }
  }
  return false;
}

const DataColumn* DataTable::FindColumn(absl::string_view name) const {
  int index = ColumnIndex(name);
  return index < 0 ? nullptr : columns_[index].get();
}

int DataTable::ColumnIndex(absl::string_view name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i]->name() == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

absl::StatusOr<DataColumn*> DataTable::AddColumn(std::string name,
                                                 const Type& data_type) {
  if (FindColumn(name) != nullptr) {
    return absl::AlreadyExistsError(absl::StrFormat(
        "column %s already exists in table %s", name, name_));
  }
  if (!rows_.empty()) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "cannot add column %s to table %s which already has rows", name,
        name_));
  }
  columns_.push_back(std::make_shared<DataColumn>(std::move(name), data_type));
  return columns_.back().get();
}

absl::StatusOr<DataRow*> DataTable::AddRow(std::vector<Value> values) {
  if (values.size() != columns_.size()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "table %s has %d columns, but the row has %d values", name_,
        columns_.size(), values.size()));
  }
  for (size_t i = 0; i < values.size(); ++i) {
    const DataColumn& column = *columns_[i];
    if (!column.Accepts(values[i])) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "column %s.%s of type %s cannot hold %v", name_, column.name(),
          column.data_type().name(), values[i]));
    }
  }
  // Columns cannot change once there are rows, so all rows share them.
  rows_.push_back(std::shared_ptr<DataRow>(
      new DataRow(name_, columns_, std::move(values))));
  return rows_.back().get();
}

absl::Status DataTable::SetPrimaryKey(std::vector<std::string> column_names) {
  absl::flat_hash_set<absl::string_view> seen;
  for (const std::string& name : column_names) {
    if (FindColumn(name) == nullptr) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "primary key column %s does not exist in table %s", name, name_));
    }
    if (!seen.insert(name).second) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "primary key column %s is listed twice", name));
    }
  }
  primary_key_ = std::move(column_names);
  return absl::OkStatus();
}

void DataTable::AcceptChanges() {
  for (auto& row : rows_) {
    row->set_row_state(RowState::kUnchanged);
  }
}

}  // namespace equivalency::data

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
#ifndef EQUIVALENCY_DATA_DATA_TABLE_H_
#define EQUIVALENCY_DATA_DATA_TABLE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "equivalency/data/data_column.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {

enum class RowState { kDetached, kUnchanged, kAdded, kDeleted, kModified };

absl::string_view RowStateName(RowState state);

template <typename Sink>
void AbslStringify(Sink& sink, RowState state) {
  sink.Append(RowStateName(state));
}

enum class SerializationFormat { kXml, kBinary };

absl::string_view SerializationFormatName(SerializationFormat format);

template <typename Sink>
void AbslStringify(Sink& sink, SerializationFormat format) {
  sink.Append(SerializationFormatName(format));
}

// Registered types of DataRow and DataTable objects.
const Type& DataRowType();
const Type& DataTableType();

class DataTable;

// One row of a DataTable. Values are aligned with the columns of the table.
// The row shares the columns of its table and stays usable after the table
// is gone. Rows are created by DataTable::AddRow.
class DataRow : public Object {
 public:
  const Type& GetType() const override { return DataRowType(); }
  std::string DebugString() const override;

  const std::string& table_name() const { return table_name_; }
  const std::vector<std::shared_ptr<DataColumn>>& columns() const {
    return columns_;
  }
  const std::vector<Value>& values() const { return values_; }

  // Value of the named column, or nullptr if the row has no such column.
  const Value* Find(absl::string_view column_name) const;

  RowState row_state() const { return row_state_; }
  const std::string& row_error() const { return row_error_; }
  bool has_errors() const { return !row_error_.empty(); }

  DataRow& set_row_state(RowState state) {
    row_state_ = state;
    return *this;
  }
  DataRow& set_row_error(std::string error) {
    row_error_ = std::move(error);
    return *this;
  }

 private:
  friend class DataTable;

  DataRow(std::string table_name,
          std::vector<std::shared_ptr<DataColumn>> columns,
          std::vector<Value> values)
      : table_name_(std::move(table_name)),
        columns_(std::move(columns)),
        values_(std::move(values)) {}

  std::string table_name_;
  std::vector<std::shared_ptr<DataColumn>> columns_;
  std::vector<Value> values_;
  RowState row_state_ = RowState::kAdded;
  std::string row_error_;
};

// Named table of typed columns and rows.
//
// Columns have to be added before rows. Rows are validated against the
// columns when they are added.
class DataTable : public Object {
 public:
  explicit DataTable(std::string name)
      : name_(std::move(name)),
        extended_properties_(std::make_shared<Dict>()) {}

  static std::shared_ptr<DataTable> Create(std::string name) {
    return std::make_shared<DataTable>(std::move(name));
  }

  DataTable(const DataTable&) = delete;
  DataTable& operator=(const DataTable&) = delete;

  const Type& GetType() const override { return DataTableType(); }
  std::string DebugString() const override;

  const std::string& name() const { return name_; }
  bool case_sensitive() const { return case_sensitive_; }
  const std::string& display_expression() const { return display_expression_; }
  const std::string& locale() const { return locale_; }
  const std::string& namespace_uri() const { return namespace_uri_; }
  const std::string& prefix() const { return prefix_; }
  SerializationFormat remoting_format() const { return remoting_format_; }
  const std::shared_ptr<Dict>& extended_properties() const {
    return extended_properties_;
  }

  // True if any row has errors.
  bool has_errors() const;

  DataTable& set_case_sensitive(bool value) {
    case_sensitive_ = value;
    return *this;
  }
  DataTable& set_display_expression(std::string value) {
    display_expression_ = std::move(value);
    return *this;
  }
  DataTable& set_locale(std::string value) {
    locale_ = std::move(value);
    return *this;
  }
  DataTable& set_namespace_uri(std::string value) {
    namespace_uri_ = std::move(value);
    return *this;
  }
  DataTable& set_prefix(std::string value) {
    prefix_ = std::move(value);
    return *this;
  }
  DataTable& set_remoting_format(SerializationFormat value) {
    remoting_format_ = value;
    return *this;
  }

  const std::vector<std::shared_ptr<DataColumn>>& columns() const {
    return columns_;
  }
  const std::vector<std::shared_ptr<DataRow>>& rows() const { return rows_; }
  const std::vector<std::string>& primary_key() const { return primary_key_; }

  // Returns nullptr if there is no such column.
  const DataColumn* FindColumn(absl::string_view name) const;
  // Returns -1 if there is no such column.
  int ColumnIndex(absl::string_view name) const;

  // Adds a column. Fails if the name is taken or the table has rows.
  absl::StatusOr<DataColumn*> AddColumn(std::string name,
                                        const Type& data_type);

  // Adds a row with one value per column.
  absl::StatusOr<DataRow*> AddRow(std::vector<Value> values);

  absl::Status SetPrimaryKey(std::vector<std::string> column_names);

  // Marks all rows as unchanged.
  void AcceptChanges();

 private:
  std::string name_;
  bool case_sensitive_ = false;
  std::string display_expression_;
  std::string locale_ = "en-US";
  std::string namespace_uri_;
  std::string prefix_;
  SerializationFormat remoting_format_ = SerializationFormat::kXml;
  std::shared_ptr<Dict> extended_properties_;
  std::vector<std::shared_ptr<DataColumn>> columns_;
  std::vector<std::shared_ptr<DataRow>> rows_;
  std::vector<std::string> primary_key_;
};

}  // namespace equivalency::data

#endif  // EQUIVALENCY_DATA_DATA_TABLE_H_

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
#ifndef EQUIVALENCY_DATA_DATA_SET_H_
#define EQUIVALENCY_DATA_DATA_SET_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "equivalency/data/data_relation.h"
#include "equivalency/data/data_table.h"
#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {

enum class SchemaSerializationMode { kIncludeSchema, kExcludeSchema };

absl::string_view SchemaSerializationModeName(SchemaSerializationMode mode);

template <typename Sink>
void AbslStringify(Sink& sink, SchemaSerializationMode mode) {
  sink.Append(SchemaSerializationModeName(mode));
}

// Registered type of DataSet objects. Typed datasets register a subtype with
// Type::Builder(...).WithBase(DataSetType()).
const Type& DataSetType();

// In-memory collection of named tables and the relations between them.
class DataSet : public Object {
 public:
  // `type` must be DataSetType() or a type derived from it.
  explicit DataSet(std::string name, const Type& type = DataSetType());

  static std::shared_ptr<DataSet> Create(std::string name) {
    return std::make_shared<DataSet>(std::move(name));
  }

  DataSet(const DataSet&) = delete;
  DataSet& operator=(const DataSet&) = delete;

  const Type& GetType() const override { return *type_; }
  std::string DebugString() const override;

  const std::string& name() const { return name_; }
  bool case_sensitive() const { return case_sensitive_; }
  bool enforce_constraints() const { return enforce_constraints_; }
  const std::string& locale() const { return locale_; }
  const std::string& namespace_uri() const { return namespace_uri_; }
  const std::string& prefix() const { return prefix_; }
  SerializationFormat remoting_format() const { return remoting_format_; }
  SchemaSerializationMode schema_serialization_mode() const {
    return schema_serialization_mode_;
  }
  const std::shared_ptr<Dict>& extended_properties() const {
    return extended_properties_;
  }

  // True if any table has errors.
  bool has_errors() const;

  DataSet& set_name(std::string value) {
    name_ = std::move(value);
    return *this;
  }
  DataSet& set_case_sensitive(bool value) {
    case_sensitive_ = value;
    return *this;
  }
  DataSet& set_enforce_constraints(bool value) {
    enforce_constraints_ = value;
    return *this;
  }
  DataSet& set_locale(std::string value) {
    locale_ = std::move(value);
    return *this;
  }
  DataSet& set_namespace_uri(std::string value) {
    namespace_uri_ = std::move(value);
    return *this;
  }
  DataSet& set_prefix(std::string value) {
    prefix_ = std::move(value);
    return *this;
  }
  DataSet& set_remoting_format(SerializationFormat value) {
    remoting_format_ = value;
    return *this;
  }
  DataSet& set_schema_serialization_mode(SchemaSerializationMode value) {
    schema_serialization_mode_ = value;
    return *this;
  }

  const std::vector<std::shared_ptr<DataTable>>& tables() const {
    return tables_;
  }
  const std::vector<std::shared_ptr<DataRelation>>& relations() const {
    return relations_;
  }

  // Returns nullptr if there is no table with this name.
  const DataTable* FindTable(absl::string_view name) const;

  // Fails with AlreadyExistsError if a table with the same name exists.
  absl::Status AddTable(std::shared_ptr<DataTable> table);

  // Fails if the relation name is taken or the relation references unknown
  // tables or columns.
  absl::Status AddRelation(std::shared_ptr<DataRelation> relation);

 private:
  std::string name_;
  const Type* type_;
  bool case_sensitive_ = false;
  bool enforce_constraints_ = true;
  std::string locale_ = "en-US";
  std::string namespace_uri_;
  std::string prefix_;
  SerializationFormat remoting_format_ = SerializationFormat::kXml;
  SchemaSerializationMode schema_serialization_mode_ =
      SchemaSerializationMode::kIncludeSchema;
  std::shared_ptr<Dict> extended_properties_;
  std::vector<std::shared_ptr<DataTable>> tables_;
  std::vector<std::shared_ptr<DataRelation>> relations_;
};

}  // namespace equivalency::data

#endif  // EQUIVALENCY_DATA_DATA_SET_H_

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
#ifndef EQUIVALENCY_DATA_DATA_RELATION_H_
#define EQUIVALENCY_DATA_DATA_RELATION_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {

// Registered type of DataRelation objects.
const Type& DataRelationType();

// Parent/child link between the columns of two tables of a DataSet. Tables
// and columns are referenced by name.
class DataRelation : public Object {
 public:
  DataRelation(std::string name, std::string parent_table,
               std::vector<std::string> parent_columns,
               std::string child_table, std::vector<std::string> child_columns,
               bool nested = false)
      : name_(std::move(name)),
        parent_table_(std::move(parent_table)),
        parent_columns_(std::move(parent_columns)),
        child_table_(std::move(child_table)),
        child_columns_(std::move(child_columns)),
        nested_(nested),
        extended_properties_(std::make_shared<Dict>()) {}

  const Type& GetType() const override { return DataRelationType(); }
  std::string DebugString() const override;

  const std::string& name() const { return name_; }
  const std::string& parent_table() const { return parent_table_; }
  const std::vector<std::string>& parent_columns() const {
    return parent_columns_;
  }
  const std::string& child_table() const { return child_table_; }
  const std::vector<std::string>& child_columns() const {
    return child_columns_;
  }
  bool nested() const { return nested_; }
  const std::shared_ptr<Dict>& extended_properties() const {
    return extended_properties_;
  }

 private:
  std::string name_;
  std::string parent_table_;
  std::vector<std::string> parent_columns_;
  std::string child_table_;
  std::vector<std::string> child_columns_;
  bool nested_;
  std::shared_ptr<Dict> extended_properties_;
};

}  // namespace equivalency::data

#endif  // EQUIVALENCY_DATA_DATA_RELATION_H_

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
#ifndef EQUIVALENCY_DATA_DATA_COLUMN_H_
#define EQUIVALENCY_DATA_DATA_COLUMN_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "equivalency/record.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency::data {

// Registered type of DataColumn objects.
const Type& DataColumnType();

// Schema of one column of a DataTable.
class DataColumn : public Object {
 public:
  DataColumn(std::string name, const Type& data_type)
      : name_(std::move(name)),
        caption_(name_),
        data_type_(&data_type),
        extended_properties_(std::make_shared<Dict>()) {}

  const Type& GetType() const override { return DataColumnType(); }
  std::string DebugString() const override;

  const std::string& name() const { return name_; }
  const std::string& caption() const { return caption_; }
  const Type& data_type() const { return *data_type_; }
  bool allow_db_null() const { return allow_db_null_; }
  bool auto_increment() const { return auto_increment_; }
  // -1 means unlimited.
  int64_t max_length() const { return max_length_; }
  bool read_only() const { return read_only_; }
  bool unique() const { return unique_; }
  const std::shared_ptr<Dict>& extended_properties() const {
    return extended_properties_;
  }

  DataColumn& set_caption(std::string caption) {
    caption_ = std::move(caption);
    return *this;
  }
  DataColumn& set_allow_db_null(bool value) {
    allow_db_null_ = value;
    return *this;
  }
  DataColumn& set_auto_increment(bool value) {
    auto_increment_ = value;
    return *this;
  }
  DataColumn& set_max_length(int64_t value) {
    max_length_ = value;
    return *this;
  }
  DataColumn& set_read_only(bool value) {
    read_only_ = value;
    return *this;
  }
  DataColumn& set_unique(bool value) {
    unique_ = value;
    return *this;
  }

  // Returns true if `value` can be stored in the column.
  bool Accepts(const Value& value) const;

 private:
  std::string name_;
  std::string caption_;
  const Type* data_type_;
  bool allow_db_null_ = true;
  bool auto_increment_ = false;
  int64_t max_length_ = -1;
  bool read_only_ = false;
  bool unique_ = false;
  std::shared_ptr<Dict> extended_properties_;
};

}  // namespace equivalency::data

#endif  // EQUIVALENCY_DATA_DATA_COLUMN_H_

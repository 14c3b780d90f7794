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
#include "equivalency/steps/data_column_step.h"

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/data/data_column.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/steps/step_utils.h"
#include "equivalency/validation_context.h"

namespace equivalency::steps {
namespace {

using ::equivalency::data::DataColumn;

constexpr absl::string_view kScalarMembers[] = {
    "ColumnName", "Caption",   "DataType", "AllowDBNull",
    "AutoIncrement", "MaxLength", "ReadOnly", "Unique"};

}  // namespace

bool DataColumnEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return IsExpectationOfType(context, options, data::DataColumnType()) &&
         (context.expectation().is_null() ||
          context.expectation().As<DataColumn>() != nullptr);
}

absl::StatusOr<bool> DataColumnEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  if (CheckSubject<DataColumn>(context, "DataColumn", scope) == nullptr) {
    return true;
  }
  const SelectedMembers selected = GetSelectedMembersByName(context, options);
  CompareScalarMembers(context, selected, "DataColumn", kScalarMembers, scope);
  RETURN_IF_ERROR(CompareMatchedMember(context, selected, "ExtendedProperties",
                                       parent, options));
  return true;
}

std::string DataColumnEquivalencyStep::ToString() const {
  return "Compare DataColumns";
}

}  // namespace equivalency::steps

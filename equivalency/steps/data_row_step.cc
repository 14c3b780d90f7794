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
#include "equivalency/steps/data_row_step.h"

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/data/data_column.h"
#include "equivalency/data/data_table.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/steps/step_utils.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

using ::equivalency::data::DataRow;

constexpr absl::string_view kScalarMembers[] = {"RowState", "HasErrors",
                                                "RowError"};

}  // namespace

bool DataRowEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return IsExpectationOfType(context, options, data::DataRowType()) &&
         (context.expectation().is_null() ||
          context.expectation().As<DataRow>() != nullptr);
}

absl::StatusOr<bool> DataRowEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const DataRow* subject = CheckSubject<DataRow>(context, "DataRow", scope);
  if (subject == nullptr) {
    return true;
  }
  const DataRow& expectation = *context.expectation().As<DataRow>();

  const SelectedMembers selected = GetSelectedMembersByName(context, options);
  CompareScalarMembers(context, selected, "DataRow", kScalarMembers, scope);

  for (const auto& column : expectation.columns()) {
    if (options.ShouldExcludeColumn(expectation.table_name(),
                                    column->name())) {
      continue;
    }
    const Value* subject_value = subject->Find(column->name());
    if (subject_value == nullptr) {
      scope.FailWith(
          "Expected {context:DataRow} to have column '{0}'{reason}, but did "
          "not find it",
          column->name());
      continue;
    }
    const Value* expectation_value = expectation.Find(column->name());
    std::optional<EquivalencyValidationContext> nested =
        context.AsCollectionItem(column->name(), *subject_value,
                                 *expectation_value, &column->data_type());
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  return true;
}

std::string DataRowEquivalencyStep::ToString() const {
  return "Compare DataRows";
}

}  // namespace equivalency::steps

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
#include "equivalency/steps/data_table_step.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/data/data_column.h"
#include "equivalency/data/data_table.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/steps/step_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

using ::equivalency::data::DataColumnType;
using ::equivalency::data::DataRowType;
using ::equivalency::data::DataTable;

constexpr absl::string_view kScalarMembers[] = {
    "TableName", "CaseSensitive", "DisplayExpression", "HasErrors",
    "Locale",    "Namespace",     "Prefix",            "RemotingFormat"};

std::vector<NamedItem> Columns(const DataTable& table,
                               const EquivalencyOptions& options,
                               absl::string_view table_name) {
  std::vector<NamedItem> columns;
  for (const auto& column : table.columns()) {
    if (!options.ShouldExcludeColumn(table_name, column->name())) {
      columns.push_back({column->name(), Value(column)});
    }
  }
  return columns;
}

absl::Status CompareColumns(const EquivalencyValidationContext& context,
                            const DataTable& subject,
                            const DataTable& expectation,
                            EquivalencyValidator& parent,
                            const EquivalencyOptions& options) {
  // Exclusions are looked up by the name of the expected table.
  const std::vector<NamedItem> subject_columns =
      Columns(subject, options, expectation.name());
  const std::vector<NamedItem> expectation_columns =
      Columns(expectation, options, expectation.name());
  parent.scope()
      .ForCondition(subject_columns.size() == expectation_columns.size())
      .FailWith("Expected {context:DataTable} to contain {0} column(s){reason}, "
                "but found {1}",
                expectation_columns.size(), subject_columns.size());
  return CompareItemsByName(
      context,
      {.owner_label = "DataTable",
       .member_name = "Columns",
       .item_noun = "column",
       .item_type = &DataColumnType()},
      subject_columns, expectation_columns,
      [](absl::string_view) { return false; }, parent, options);
}

void ComparePrimaryKey(const DataTable& subject, const DataTable& expectation,
                       AssertionScope& scope) {
  scope.ForCondition(subject.primary_key() == expectation.primary_key())
      .FailWith("Expected {context:DataTable} to have PrimaryKey '{0}'{reason}, "
                "but found '{1}' instead",
                absl::StrJoin(expectation.primary_key(), ", "),
                absl::StrJoin(subject.primary_key(), ", "));
}

absl::Status CompareRows(const EquivalencyValidationContext& context,
                         const DataTable& subject,
                         const DataTable& expectation,
                         EquivalencyValidator& parent,
                         const EquivalencyOptions& options) {
  const size_t subject_count = subject.rows().size();
  const size_t expectation_count = expectation.rows().size();
  parent.scope()
      .ForCondition(subject_count == expectation_count)
      .FailWith("Expected {context:DataTable} to contain {0} row(s){reason}, "
                "but found {1}",
                expectation_count, subject_count);

  const EquivalencyValidationContext rows_context(
      context.node().ChildMember("Rows"), Value(), Value(),
      ListOf(DataRowType()));
  const size_t count = std::min(subject_count, expectation_count);
  for (size_t i = 0; i < count; ++i) {
    std::optional<EquivalencyValidationContext> nested =
        rows_context.AsCollectionItem(i, Value(subject.rows()[i]),
                                      Value(expectation.rows()[i]));
    if (nested.has_value()) {
      RETURN_IF_ERROR(parent.AssertEqualityUsing(*nested, options));
    }
  }
  return absl::OkStatus();
}

}  // namespace

bool DataTableEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  return IsExpectationOfType(context, options, data::DataTableType()) &&
         (context.expectation().is_null() ||
          context.expectation().As<DataTable>() != nullptr);
}

absl::StatusOr<bool> DataTableEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const DataTable* subject =
      CheckSubject<DataTable>(context, "DataTable", scope);
  if (subject == nullptr) {
    return true;
  }
  const DataTable& expectation = *context.expectation().As<DataTable>();

  const SelectedMembers selected = GetSelectedMembersByName(context, options);
  CompareScalarMembers(context, selected, "DataTable", kScalarMembers, scope);
  RETURN_IF_ERROR(CompareMatchedMember(context, selected, "ExtendedProperties",
                                       parent, options));
  if (selected.contains("Columns")) {
    RETURN_IF_ERROR(
        CompareColumns(context, *subject, expectation, parent, options));
  }
  if (selected.contains("PrimaryKey")) {
    ComparePrimaryKey(*subject, expectation, scope);
  }
  if (selected.contains("Rows")) {
    RETURN_IF_ERROR(
        CompareRows(context, *subject, expectation, parent, options));
  }
  return true;
}

std::string DataTableEquivalencyStep::ToString() const {
  return "Compare DataTables";
}

}  // namespace equivalency::steps

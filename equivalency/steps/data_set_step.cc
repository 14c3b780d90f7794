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
#include "equivalency/steps/data_set_step.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/assertion_scope.h"
#include "equivalency/data/data_set.h"
#include "equivalency/data/data_table.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/steps/step_utils.h"
#include "equivalency/type.h"
#include "equivalency/validation_context.h"
#include "equivalency/value.h"

namespace equivalency::steps {
namespace {

using ::equivalency::data::DataSet;
using ::equivalency::data::DataTableType;

constexpr absl::string_view kScalarMembers[] = {
    "DataSetName", "CaseSensitive", "EnforceConstraints",
    "HasErrors",   "Locale",        "Namespace",
    "Prefix",      "RemotingFormat", "SchemaSerializationMode"};

constexpr absl::string_view kCollectionMembers[] = {"ExtendedProperties",
                                                    "Relations"};

std::vector<NamedItem> Tables(const DataSet& data_set) {
  std::vector<NamedItem> tables;
  tables.reserve(data_set.tables().size());
  for (const auto& table : data_set.tables()) {
    tables.push_back({table->name(), Value(table)});
  }
  return tables;
}

// Options for the tables of a DataSet. Properties that the DataSet
// comparison skipped are skipped for its tables as well.
EquivalencyOptions GetTableOptions(const EquivalencyOptions& options,
                                   const SelectedMembers& selected) {
  EquivalencyOptions table_options = options;
  if (!options.allow_mismatched_types()) {
    return table_options;
  }
  const bool exclude_case_sensitive = !selected.contains("CaseSensitive");
  const bool exclude_locale = !selected.contains("Locale");
  if (!exclude_case_sensitive && !exclude_locale) {
    return table_options;
  }
  std::string description = "DataTable.CaseSensitive or DataTable.Locale";
  if (!exclude_locale) {
    description = "DataTable.CaseSensitive";
  } else if (!exclude_case_sensitive) {
    description = "DataTable.Locale";
  }
  table_options.Excluding(
      [exclude_case_sensitive, exclude_locale](const Member& member,
                                               absl::string_view path) {
        if (&member.declaring_type() != &DataTableType()) {
          return false;
        }
        return (exclude_case_sensitive && member.name() == "CaseSensitive") ||
               (exclude_locale && member.name() == "Locale");
      },
      description);
  return table_options;
}

absl::Status CompareTables(const EquivalencyValidationContext& context,
                           const DataSet& subject, const DataSet& expectation,
                           const SelectedMembers& selected,
                           EquivalencyValidator& parent,
                           const EquivalencyOptions& options) {
  if (!selected.contains("Tables")) {
    return absl::OkStatus();
  }
  parent.scope()
      .ForCondition(subject.tables().size() == expectation.tables().size())
      .FailWith("Expected {context:DataSet} to contain {0}, but found {1} "
                "table(s)",
                expectation.tables().size(), subject.tables().size());

  const EquivalencyOptions table_options = GetTableOptions(options, selected);
  return CompareItemsByName(
      context,
      {.owner_label = "DataSet",
       .member_name = "Tables",
       .item_noun = "table",
       .item_type = &DataTableType()},
      Tables(subject), Tables(expectation),
      [&](absl::string_view name) { return options.ShouldExcludeTable(name); },
      parent, table_options);
}

}  // namespace

bool DataSetEquivalencyStep::CanHandle(
    const EquivalencyValidationContext& context,
    const EquivalencyOptions& options) const {
  if (!IsExpectationOfType(context, options, data::DataSetType())) {
    return false;
  }
  // A declared DataSet member may still hold something else.
  return context.expectation().is_null() ||
         context.expectation().As<DataSet>() != nullptr;
}

absl::StatusOr<bool> DataSetEquivalencyStep::Handle(
    const EquivalencyValidationContext& context, EquivalencyValidator& parent,
    const EquivalencyOptions& options) const {
  AssertionScope& scope = parent.scope();
  const DataSet* subject = CheckSubject<DataSet>(context, "DataSet", scope);
  if (subject == nullptr) {
    return true;
  }
  const DataSet& expectation = *context.expectation().As<DataSet>();

  if (!options.allow_mismatched_types()) {
    scope.ForCondition(&subject->GetType() == &expectation.GetType())
        .FailWith("Expected {context:DataSet} to be of type '{0}'{reason}, but "
                  "found '{1}'",
                  expectation.GetType(), subject->GetType());
  }

  const SelectedMembers selected = GetSelectedMembersByName(context, options);
  CompareScalarMembers(context, selected, "DataSet", kScalarMembers, scope);
  for (absl::string_view member_name : kCollectionMembers) {
    RETURN_IF_ERROR(
        CompareMatchedMember(context, selected, member_name, parent, options));
  }
  RETURN_IF_ERROR(
      CompareTables(context, *subject, expectation, selected, parent, options));
  return true;
}

std::string DataSetEquivalencyStep::ToString() const {
  return "Compare DataSets";
}

}  // namespace equivalency::steps

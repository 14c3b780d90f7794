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
#ifndef EQUIVALENCY_STEPS_DATA_SET_STEP_H_
#define EQUIVALENCY_STEPS_DATA_SET_STEP_H_

#include <string>

#include "absl/status/statusor.h"
#include "equivalency/equivalency_options.h"
#include "equivalency/equivalency_step.h"
#include "equivalency/equivalency_validator.h"
#include "equivalency/validation_context.h"

namespace equivalency::steps {

// Compares DataSets.
//
// The selected scalar properties are compared first, each with its own
// failure: DataSetName, CaseSensitive, EnforceConstraints, HasErrors, Locale,
// Namespace, Prefix, RemotingFormat and SchemaSerializationMode. Then
// ExtendedProperties and Relations are compared through the matching rules.
// Finally tables are matched by name, independently of their order, and
// compared at `Tables[<name>]`.
//
// When mismatched types are allowed and CaseSensitive or Locale is not
// selected for the DataSet, the same property is not compared for its
// tables either.
class DataSetEquivalencyStep final : public EquivalencyStep {
 public:
  bool CanHandle(const EquivalencyValidationContext& context,
                 const EquivalencyOptions& options) const override;

  absl::StatusOr<bool> Handle(const EquivalencyValidationContext& context,
                              EquivalencyValidator& parent,
                              const EquivalencyOptions& options) const override;

  std::string ToString() const override;
};

}  // namespace equivalency::steps

#endif  // EQUIVALENCY_STEPS_DATA_SET_STEP_H_

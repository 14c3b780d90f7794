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
#include "equivalency/steps/default_steps.h"

#include <memory>
#include <vector>

#include "absl/base/no_destructor.h"
#include "equivalency/equivalency_step.h"
#include "equivalency/steps/data_column_step.h"
#include "equivalency/steps/data_row_step.h"
#include "equivalency/steps/data_set_step.h"
#include "equivalency/steps/data_table_step.h"
#include "equivalency/steps/dictionary_step.h"
#include "equivalency/steps/enumerable_step.h"
#include "equivalency/steps/reference_equality_step.h"
#include "equivalency/steps/simple_equality_step.h"
#include "equivalency/steps/string_step.h"
#include "equivalency/steps/structural_step.h"

namespace equivalency::steps {

const std::vector<std::shared_ptr<const EquivalencyStep>>& DefaultSteps() {
  using Steps = std::vector<std::shared_ptr<const EquivalencyStep>>;
  static const absl::NoDestructor<Steps> steps(Steps{
      std::make_shared<ReferenceEqualityEquivalencyStep>(),
      std::make_shared<DictionaryEquivalencyStep>(),
      std::make_shared<DataSetEquivalencyStep>(),
      std::make_shared<DataTableEquivalencyStep>(),
      std::make_shared<DataColumnEquivalencyStep>(),
      std::make_shared<DataRowEquivalencyStep>(),
      std::make_shared<EnumerableEquivalencyStep>(),
      std::make_shared<StringEquivalencyStep>(),
      std::make_shared<SimpleEqualityEquivalencyStep>(),
      std::make_shared<StructuralEquivalencyStep>(),
  });
  return *steps;
}

}  // namespace equivalency::steps

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
#ifndef EQUIVALENCY_STEPS_DEFAULT_STEPS_H_
#define EQUIVALENCY_STEPS_DEFAULT_STEPS_H_

#include <memory>
#include <vector>

#include "equivalency/equivalency_step.h"

namespace equivalency::steps {

// The built-in step chain, in the order in which the steps are asked:
// reference equality, dictionaries, DataSets, DataTables, DataColumns,
// DataRows, collections, strings, scalars and finally the member by member
// comparison of any other object.
const std::vector<std::shared_ptr<const EquivalencyStep>>& DefaultSteps();

}  // namespace equivalency::steps

#endif  // EQUIVALENCY_STEPS_DEFAULT_STEPS_H_

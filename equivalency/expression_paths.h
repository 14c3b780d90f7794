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
#ifndef EQUIVALENCY_EXPRESSION_PATHS_H_
#define EQUIVALENCY_EXPRESSION_PATHS_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "equivalency/member_expression.h"
#include "equivalency/member_path.h"

namespace equivalency {

// Returns the member paths selected by `expression`.
//
// Lambda and conversion nodes are unwrapped, member accesses and constant
// indexers become path segments, and walking stops at the parameter. A
// `new(...)` node selects one path per argument. The declaring type of the
// result is the one of the outermost member access, or the input type if
// there is none (`x => x`).
//
// Any other node returns InvalidArgumentError.
absl::StatusOr<std::vector<MemberPath>> GetMemberPaths(
    const ExpressionPtr& expression);

// Returns the first path of GetMemberPaths.
absl::StatusOr<MemberPath> GetMemberPath(const ExpressionPtr& expression);

// Checks that `expression` can select a member, without building the paths.
absl::Status ValidateMemberPath(const ExpressionPtr& expression);

}  // namespace equivalency

#endif  // EQUIVALENCY_EXPRESSION_PATHS_H_

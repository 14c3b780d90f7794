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
#include "equivalency/expression_paths.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/member_expression.h"
#include "equivalency/member_path.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {
namespace {

// Collects path pieces during the walk. Segments are recorded innermost
// first, so they are reversed when the path is assembled.
struct PathParts {
  std::vector<std::string> segments;
  std::vector<std::string> selectors;
  std::vector<const Type*> declaring_types;
  const Type* input_type = nullptr;
};

absl::Status UnsupportedExpression(const Expression& expression) {
  const Expression& body = expression.kind() == ExpressionKind::kLambda
                               ? *expression.operands()[0]
                               : expression;
  return absl::InvalidArgumentError(absl::StrCat(
      "Expression <", body.ToString(), "> cannot be used to select a member."));
}

// Walks from `node` towards the parameter. Errors name the whole `root`
// expression. `parts` is nullptr when only the shape is validated.
absl::Status WalkNode(const Expression* node, const Expression& root,
                      PathParts* parts) {
  while (node != nullptr) {
    switch (node->kind()) {
      case ExpressionKind::kLambda:
      case ExpressionKind::kConvert:
      case ExpressionKind::kConvertChecked:
        node = node->operands()[0].get();
        break;
      case ExpressionKind::kMemberAccess:
        if (parts != nullptr) {
          parts->segments.push_back(node->member()->name());
          parts->declaring_types.push_back(&node->member()->declaring_type());
        }
        node = node->operands()[0].get();
        break;
      case ExpressionKind::kArrayIndex: {
        const Expression& index = *node->operands()[1];
        if (index.kind() != ExpressionKind::kConstant) {
          return UnsupportedExpression(root);
        }
        if (parts != nullptr) {
          parts->segments.push_back(
              absl::StrCat("[", ValueText(index.constant()), "]"));
        }
        node = node->operands()[0].get();
        break;
      }
      case ExpressionKind::kParameter:
        if (parts != nullptr && parts->input_type == nullptr) {
          parts->input_type = &node->type();
        }
        node = nullptr;
        break;
      case ExpressionKind::kCall: {
        const auto& operands = node->operands();
        if (node->name() != kIndexerMethodName || operands.size() != 2 ||
            operands[1]->kind() != ExpressionKind::kConstant) {
          return UnsupportedExpression(root);
        }
        if (parts != nullptr) {
          parts->segments.push_back(
              absl::StrCat("[", ValueText(operands[1]->constant()), "]"));
        }
        node = operands[0].get();
        break;
      }
      case ExpressionKind::kNew:
        // Every argument is a member chain of its own and yields one path.
        for (const ExpressionPtr& arg : node->operands()) {
          PathParts arg_parts;
          RETURN_IF_ERROR(WalkNode(arg.get(), root, &arg_parts));
          if (arg_parts.declaring_types.empty() ||
              !arg_parts.selectors.empty()) {
            return UnsupportedExpression(root);
          }
          if (parts != nullptr) {
            std::reverse(arg_parts.segments.begin(), arg_parts.segments.end());
            parts->selectors.push_back(absl::StrJoin(arg_parts.segments, "."));
            parts->declaring_types.push_back(
                arg_parts.declaring_types.front());
          }
        }
        node = nullptr;
        break;
      default:
        return UnsupportedExpression(root);
    }
  }
  return absl::OkStatus();
}

absl::Status WalkExpression(const ExpressionPtr& expression,
                            PathParts* parts) {
  if (expression == nullptr) {
    return absl::InvalidArgumentError(
        "Expected an expression, but found <null>.");
  }
  if (parts != nullptr && expression->kind() == ExpressionKind::kLambda) {
    parts->input_type = &expression->operands()[1]->type();
  }
  return WalkNode(expression.get(), *expression, parts);
}

}  // namespace

absl::StatusOr<std::vector<MemberPath>> GetMemberPaths(
    const ExpressionPtr& expression) {
  PathParts parts;
  RETURN_IF_ERROR(WalkExpression(expression, &parts));

  const Type& input_type =
      parts.input_type != nullptr ? *parts.input_type : ObjectType();
  const Type& declaring_type = parts.declaring_types.empty()
                                   ? input_type
                                   : *parts.declaring_types.front();

  std::vector<MemberPath> paths;
  if (parts.selectors.empty()) {
    std::reverse(parts.segments.begin(), parts.segments.end());
    paths.emplace_back(input_type, declaring_type,
                       absl::StrJoin(parts.segments, "."));
    return paths;
  }
  for (const std::string& selector : parts.selectors) {
    paths.emplace_back(input_type, declaring_type, selector);
  }
  return paths;
}

absl::StatusOr<MemberPath> GetMemberPath(const ExpressionPtr& expression) {
  ASSIGN_OR_RETURN(std::vector<MemberPath> paths, GetMemberPaths(expression));
  return paths.front();
}

absl::Status ValidateMemberPath(const ExpressionPtr& expression) {
  return WalkExpression(expression, nullptr);
}

}  // namespace equivalency

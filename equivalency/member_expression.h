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
#ifndef EQUIVALENCY_MEMBER_EXPRESSION_H_
#define EQUIVALENCY_MEMBER_EXPRESSION_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

// Name of the single-argument item accessor recognized as an indexer.
inline constexpr absl::string_view kIndexerMethodName = "operator[]";

enum class ExpressionKind {
  kLambda,
  kParameter,
  kConvert,
  kConvertChecked,
  kMemberAccess,
  kArrayIndex,
  kCall,
  kNew,
  kConstant,
  kAdd,
  kSubtract,
  kMultiply,
  kConditional,
};

class Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;

// Typed accessor expression over a single input parameter, e.g.
// `x => x.Parent.Children[2].Name`. Nodes are immutable and created by the
// factory functions in the `expr` namespace.
class Expression {
 public:
  ExpressionKind kind() const { return kind_; }

  // Static type of the value the node evaluates to.
  const Type& type() const { return *type_; }

  // Child nodes. Their meaning depends on the kind:
  //   kLambda: {body, parameter}
  //   kConvert, kConvertChecked: {operand}
  //   kMemberAccess: {object}
  //   kArrayIndex: {array, index}
  //   kCall: {object, args...}
  //   kNew: {args...}
  //   kAdd, kSubtract, kMultiply: {lhs, rhs}
  //   kConditional: {test, if_true, if_false}
  const std::vector<ExpressionPtr>& operands() const { return operands_; }

  // Accessed member of kMemberAccess nodes.
  const Member* member() const { return member_; }

  // Value of kConstant nodes.
  const Value& constant() const { return constant_; }

  // Parameter name of kParameter nodes, method name of kCall nodes.
  const std::string& name() const { return name_; }

  std::string ToString() const;

 private:
  friend class ExpressionFactory;

  Expression(ExpressionKind kind, const Type& type,
             std::vector<ExpressionPtr> operands)
      : kind_(kind), type_(&type), operands_(std::move(operands)) {}

  ExpressionKind kind_;
  const Type* type_;
  std::vector<ExpressionPtr> operands_;
  const Member* member_ = nullptr;
  Value constant_;
  std::string name_;
};

namespace expr {

ExpressionPtr Parameter(const Type& type, std::string name = "x");

// Accesses `member_name` of `object`. Fails if the static type of `object`
// has no such member.
absl::StatusOr<ExpressionPtr> MemberAccess(ExpressionPtr object,
                                           absl::string_view member_name);

ExpressionPtr Constant(Value value);

// Indexes a list typed expression. Fails if `array` is not a list.
absl::StatusOr<ExpressionPtr> ArrayIndex(ExpressionPtr array,
                                         ExpressionPtr index);

ExpressionPtr Call(ExpressionPtr object, std::string method,
                   std::vector<ExpressionPtr> args, const Type& result_type);

// `object[key]` on a list (array index) or a dict (indexer call).
absl::StatusOr<ExpressionPtr> Index(ExpressionPtr object, Value key);

ExpressionPtr Convert(ExpressionPtr operand, const Type& type);
ExpressionPtr ConvertChecked(ExpressionPtr operand, const Type& type);

ExpressionPtr New(std::vector<ExpressionPtr> args);

ExpressionPtr Add(ExpressionPtr lhs, ExpressionPtr rhs);
ExpressionPtr Subtract(ExpressionPtr lhs, ExpressionPtr rhs);
ExpressionPtr Multiply(ExpressionPtr lhs, ExpressionPtr rhs);

ExpressionPtr Conditional(ExpressionPtr test, ExpressionPtr if_true,
                          ExpressionPtr if_false);

ExpressionPtr Lambda(ExpressionPtr body, ExpressionPtr parameter);

}  // namespace expr

// Parses a member accessor against `type`. Accepted forms:
//   "x => x.Parent.Children[2].Name"
//   "Parent.Children[2].Name"
//   "x => new(x.Name, x.Age)"
//   "x => x"
// Index segments are integers or quoted strings; dictionary members are
// indexed through the indexer call.
absl::StatusOr<ExpressionPtr> ParseMemberExpression(const Type& type,
                                                    absl::string_view text);

}  // namespace equivalency

#endif  // EQUIVALENCY_MEMBER_EXPRESSION_H_

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
#include "equivalency/member_expression.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "arolla/util/status_macros_backport.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

class ExpressionFactory {
 public:
  static std::shared_ptr<Expression> Make(
      ExpressionKind kind, const Type& type,
      std::vector<ExpressionPtr> operands = {}) {
    return std::shared_ptr<Expression>(
        new Expression(kind, type, std::move(operands)));
  }

  static void SetMember(Expression& node, const Member* member) {
    node.member_ = member;
  }
  static void SetConstant(Expression& node, Value value) {
    node.constant_ = std::move(value);
  }
  static void SetName(Expression& node, std::string name) {
    node.name_ = std::move(name);
  }
};

namespace {

std::string JoinExpressions(const std::vector<ExpressionPtr>& nodes,
                            size_t begin) {
  std::vector<std::string> parts;
  for (size_t i = begin; i < nodes.size(); ++i) {
    parts.push_back(nodes[i]->ToString());
  }
  return absl::StrJoin(parts, ", ");
}

std::string BinaryToString(const Expression& node, absl::string_view op) {
  return absl::StrCat("(", node.operands()[0]->ToString(), " ", op, " ",
                      node.operands()[1]->ToString(), ")");
}

}  // namespace

std::string Expression::ToString() const {
  switch (kind_) {
    case ExpressionKind::kLambda:
      return absl::StrCat(operands_[1]->ToString(), " => ",
                          operands_[0]->ToString());
    case ExpressionKind::kParameter:
      return name_;
    case ExpressionKind::kConvert:
      return absl::StrCat("Convert(", operands_[0]->ToString(), ", ",
                          type_->name(), ")");
    case ExpressionKind::kConvertChecked:
      return absl::StrCat("ConvertChecked(", operands_[0]->ToString(), ", ",
                          type_->name(), ")");
    case ExpressionKind::kMemberAccess:
      return absl::StrCat(operands_[0]->ToString(), ".", member_->name());
    case ExpressionKind::kArrayIndex:
      return absl::StrCat(operands_[0]->ToString(), "[",
                          operands_[1]->ToString(), "]");
    case ExpressionKind::kCall:
      if (name_ == kIndexerMethodName) {
        return absl::StrCat(operands_[0]->ToString(), "[",
                            JoinExpressions(operands_, 1), "]");
      }
      return absl::StrCat(operands_[0]->ToString(), ".", name_, "(",
                          JoinExpressions(operands_, 1), ")");
    case ExpressionKind::kNew:
      return absl::StrCat("new(", JoinExpressions(operands_, 0), ")");
    case ExpressionKind::kConstant:
      return constant_.DebugString();
    case ExpressionKind::kAdd:
      return BinaryToString(*this, "+");
    case ExpressionKind::kSubtract:
      return BinaryToString(*this, "-");
    case ExpressionKind::kMultiply:
      return BinaryToString(*this, "*");
    case ExpressionKind::kConditional:
      return absl::StrCat("IIF(", JoinExpressions(operands_, 0), ")");
  }
  return "<unknown>";
}

namespace expr {

ExpressionPtr Parameter(const Type& type, std::string name) {
  auto node = ExpressionFactory::Make(ExpressionKind::kParameter, type);
  ExpressionFactory::SetName(*node, std::move(name));
  return node;
}

absl::StatusOr<ExpressionPtr> MemberAccess(ExpressionPtr object,
                                           absl::string_view member_name) {
  const Member* member = object->type().FindMember(member_name);
  if (member == nullptr) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "type %s has no member %s", object->type().name(), member_name));
  }
  auto node = ExpressionFactory::Make(ExpressionKind::kMemberAccess,
                                      member->value_type(),
                                      {std::move(object)});
  ExpressionFactory::SetMember(*node, member);
  return node;
}

ExpressionPtr Constant(Value value) {
  const Type& type = value.GetType();
  auto node = ExpressionFactory::Make(ExpressionKind::kConstant, type);
  ExpressionFactory::SetConstant(*node, std::move(value));
  return node;
}

absl::StatusOr<ExpressionPtr> ArrayIndex(ExpressionPtr array,
                                         ExpressionPtr index) {
  const Type& type = array->type();
  if (type.kind() != TypeKind::kList) {
    return absl::InvalidArgumentError(
        absl::StrFormat("cannot index %s of type %s with an array index",
                        array->ToString(), type.name()));
  }
  const Type& item_type =
      type.element_type() != nullptr ? *type.element_type() : ObjectType();
  return ExpressionFactory::Make(ExpressionKind::kArrayIndex, item_type,
                                 {std::move(array), std::move(index)});
}

ExpressionPtr Call(ExpressionPtr object, std::string method,
                   std::vector<ExpressionPtr> args, const Type& result_type) {
  std::vector<ExpressionPtr> operands;
  operands.reserve(args.size() + 1);
  operands.push_back(std::move(object));
  for (auto& arg : args) {
    operands.push_back(std::move(arg));
  }
  auto node = ExpressionFactory::Make(ExpressionKind::kCall, result_type,
                                      std::move(operands));
  ExpressionFactory::SetName(*node, std::move(method));
  return node;
}

absl::StatusOr<ExpressionPtr> Index(ExpressionPtr object, Value key) {
  const Type& type = object->type();
  switch (type.kind()) {
    case TypeKind::kList:
      if (!key.holds_value<int64_t>()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "list %s can only be indexed by integers, got %v",
            object->ToString(), key));
      }
      return ArrayIndex(std::move(object), Constant(std::move(key)));
    case TypeKind::kDict: {
      const Type& value_type =
          type.element_type() != nullptr ? *type.element_type() : ObjectType();
      return Call(std::move(object), std::string(kIndexerMethodName),
                  {Constant(std::move(key))}, value_type);
    }
    default:
      return absl::InvalidArgumentError(
          absl::StrFormat("%s of type %s cannot be indexed",
                          object->ToString(), type.name()));
  }
}

ExpressionPtr Convert(ExpressionPtr operand, const Type& type) {
  return ExpressionFactory::Make(ExpressionKind::kConvert, type,
                                 {std::move(operand)});
}

ExpressionPtr ConvertChecked(ExpressionPtr operand, const Type& type) {
  return ExpressionFactory::Make(ExpressionKind::kConvertChecked, type,
                                 {std::move(operand)});
}

ExpressionPtr New(std::vector<ExpressionPtr> args) {
  return ExpressionFactory::Make(ExpressionKind::kNew, ObjectType(),
                                 std::move(args));
}

ExpressionPtr Add(ExpressionPtr lhs, ExpressionPtr rhs) {
  const Type& type = lhs->type();
  return ExpressionFactory::Make(ExpressionKind::kAdd, type,
                                 {std::move(lhs), std::move(rhs)});
}

ExpressionPtr Subtract(ExpressionPtr lhs, ExpressionPtr rhs) {
  const Type& type = lhs->type();
  return ExpressionFactory::Make(ExpressionKind::kSubtract, type,
                                 {std::move(lhs), std::move(rhs)});
}

ExpressionPtr Multiply(ExpressionPtr lhs, ExpressionPtr rhs) {
  const Type& type = lhs->type();
  return ExpressionFactory::Make(ExpressionKind::kMultiply, type,
                                 {std::move(lhs), std::move(rhs)});
}

ExpressionPtr Conditional(ExpressionPtr test, ExpressionPtr if_true,
                          ExpressionPtr if_false) {
  const Type& type = if_true->type();
  return ExpressionFactory::Make(
      ExpressionKind::kConditional, type,
      {std::move(test), std::move(if_true), std::move(if_false)});
}

ExpressionPtr Lambda(ExpressionPtr body, ExpressionPtr parameter) {
  const Type& type = body->type();
  return ExpressionFactory::Make(ExpressionKind::kLambda, type,
                                 {std::move(body), std::move(parameter)});
}

}  // namespace expr

namespace {

bool IsIdentifierStart(char c) { return absl::ascii_isalpha(c) || c == '_'; }
bool IsIdentifierChar(char c) { return absl::ascii_isalnum(c) || c == '_'; }

// Recursive descent parser for the accessor forms listed in the header.
class MemberExpressionParser {
 public:
  MemberExpressionParser(const Type& type, absl::string_view text)
      : type_(type), text_(text) {}

  absl::StatusOr<ExpressionPtr> Parse() {
    std::string parameter_name = "x";
    bool is_lambda = false;
    SkipWhitespace();
    std::string identifier = ReadIdentifier();
    SkipWhitespace();
    if (!identifier.empty() && Consume("=>")) {
      parameter_name = identifier;
      is_lambda = true;
    } else {
      pos_ = 0;
    }
    ExpressionPtr parameter = expr::Parameter(type_, parameter_name);

    ExpressionPtr body;
    SkipWhitespace();
    if (is_lambda) {
      ASSIGN_OR_RETURN(body, ParseLambdaBody(parameter));
    } else if (AtEnd()) {
      body = parameter;
    } else {
      std::string member = ReadIdentifier();
      if (member.empty()) {
        return Error("expected a member name");
      }
      ASSIGN_OR_RETURN(body, expr::MemberAccess(parameter, member));
      ASSIGN_OR_RETURN(body, ParseAccessChain(std::move(body)));
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Error("unexpected trailing characters");
    }
    return expr::Lambda(std::move(body), std::move(parameter));
  }

 private:
  absl::StatusOr<ExpressionPtr> ParseLambdaBody(
      const ExpressionPtr& parameter) {
    size_t start = pos_;
    std::string identifier = ReadIdentifier();
    SkipWhitespace();
    if (identifier == "new" && Peek() == '(') {
      ++pos_;
      std::vector<ExpressionPtr> args;
      SkipWhitespace();
      while (Peek() != ')') {
        ASSIGN_OR_RETURN(auto arg, ParseAccessor(parameter));
        args.push_back(std::move(arg));
        SkipWhitespace();
        if (Peek() == ',') {
          ++pos_;
          SkipWhitespace();
        } else if (Peek() != ')') {
          return Error("expected ',' or ')'");
        }
      }
      ++pos_;
      return expr::New(std::move(args));
    }
    pos_ = start;
    return ParseAccessor(parameter);
  }

  // `x`, `x.A`, `x.A[1].B`.
  absl::StatusOr<ExpressionPtr> ParseAccessor(const ExpressionPtr& parameter) {
    std::string identifier = ReadIdentifier();
    if (identifier != parameter->name()) {
      return Error(absl::StrCat("expected parameter '", parameter->name(),
                                "'"));
    }
    return ParseAccessChain(parameter);
  }

  absl::StatusOr<ExpressionPtr> ParseAccessChain(ExpressionPtr node) {
    while (true) {
      SkipWhitespace();
      if (Peek() == '.') {
        ++pos_;
        std::string member = ReadIdentifier();
        if (member.empty()) {
          return Error("expected a member name");
        }
        ASSIGN_OR_RETURN(node, expr::MemberAccess(std::move(node), member));
      } else if (Peek() == '[') {
        ++pos_;
        ASSIGN_OR_RETURN(Value key, ParseIndex());
        if (!Consume("]")) {
          return Error("expected ']'");
        }
        ASSIGN_OR_RETURN(node, expr::Index(std::move(node), std::move(key)));
      } else {
        return node;
      }
    }
  }

  absl::StatusOr<Value> ParseIndex() {
    SkipWhitespace();
    if (Peek() == '"') {
      size_t end = text_.find('"', pos_ + 1);
      if (end == absl::string_view::npos) {
        return Error("unterminated string index");
      }
      std::string key(text_.substr(pos_ + 1, end - pos_ - 1));
      pos_ = end + 1;
      SkipWhitespace();
      return Value(std::move(key));
    }
    size_t start = pos_;
    if (Peek() == '-') {
      ++pos_;
    }
    while (!AtEnd() && absl::ascii_isdigit(text_[pos_])) {
      ++pos_;
    }
    int64_t index;
    if (!absl::SimpleAtoi(text_.substr(start, pos_ - start), &index)) {
      return Error("expected an integer or a quoted string index");
    }
    SkipWhitespace();
    return Value(index);
  }

  std::string ReadIdentifier() {
    if (AtEnd() || !IsIdentifierStart(text_[pos_])) {
      return "";
    }
    size_t start = pos_;
    while (!AtEnd() && IsIdentifierChar(text_[pos_])) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  bool Consume(absl::string_view token) {
    if (text_.substr(pos_, token.size()) == token) {
      pos_ += token.size();
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (!AtEnd() && absl::ascii_isspace(text_[pos_])) {
      ++pos_;
    }
  }

  char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }
  bool AtEnd() const { return pos_ >= text_.size(); }

  absl::Status Error(absl::string_view detail) const {
    return absl::InvalidArgumentError(
        absl::StrFormat("cannot parse member expression <%s> at position %d: %s",
                        text_, pos_, detail));
  }

  const Type& type_;
  absl::string_view text_;
  size_t pos_ = 0;
};

}  // namespace

absl::StatusOr<ExpressionPtr> ParseMemberExpression(const Type& type,
                                                    absl::string_view text) {
  return MemberExpressionParser(type, text).Parse();
}

}  // namespace equivalency

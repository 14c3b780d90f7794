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
#include "equivalency/assertion_scope.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace equivalency {

AssertionScope::AssertionScope(std::string context)
    : context_(std::move(context)) {}

AssertionScope::AssertionScope(AssertionScope& parent, std::string path,
                               std::string context)
    : parent_(&parent),
      path_(std::move(path)),
      context_(std::move(context)),
      reason_(parent.reason_) {}

AssertionScope::~AssertionScope() {
  if (parent_ != nullptr && !failures_.empty()) {
    parent_->AddFailures(std::move(failures_));
  }
}

AssertionScope& AssertionScope::BecauseOf(absl::string_view reason) {
  reason_ = std::string(reason);
  return *this;
}

void AssertionScope::AddFailures(std::vector<Failure> failures) {
  if (failures_.empty()) {
    failures_ = std::move(failures);
    return;
  }
  for (Failure& failure : failures) {
    failures_.push_back(std::move(failure));
  }
}

bool AssertionScope::FailWithArgs(absl::string_view message_template,
                                  std::vector<std::string> args) {
  bool succeeded = condition_.value_or(false);
  condition_.reset();
  if (!succeeded) {
    failures_.push_back({path_, Format(message_template, args)});
  }
  return succeeded;
}

std::string AssertionScope::Format(absl::string_view message_template,
                                   const std::vector<std::string>& args) const {
  std::string result;
  absl::string_view rest = message_template;
  while (!rest.empty()) {
    size_t open = rest.find('{');
    size_t close =
        open == absl::string_view::npos ? open : rest.find('}', open);
    if (close == absl::string_view::npos) {
      absl::StrAppend(&result, rest);
      break;
    }
    absl::StrAppend(&result, rest.substr(0, open));
    absl::string_view placeholder = rest.substr(open + 1, close - open - 1);
    rest.remove_prefix(close + 1);

    size_t index;
    if (absl::SimpleAtoi(placeholder, &index) && index < args.size()) {
      absl::StrAppend(&result, args[index]);
    } else if (absl::ConsumePrefix(&placeholder, "context:")) {
      absl::StrAppend(&result, context_.empty()
                                   ? placeholder
                                   : absl::string_view(context_));
    } else if (placeholder == "reason") {
      if (!reason_.empty()) {
        absl::StrAppend(&result, absl::StartsWith(reason_, "because")
                                     ? " "
                                     : " because ",
                        reason_);
      }
    } else {
      absl::StrAppend(&result, "{", placeholder, "}");
    }
  }
  return result;
}

}  // namespace equivalency

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
#ifndef EQUIVALENCY_ASSERTION_SCOPE_H_
#define EQUIVALENCY_ASSERTION_SCOPE_H_

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "equivalency/type.h"
#include "equivalency/value.h"

namespace equivalency {

// One reported mismatch.
struct Failure {
  // Path of the node that reported the failure, empty for the root.
  std::string path;
  std::string message;

  bool operator==(const Failure& other) const {
    return path == other.path && message == other.message;
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Failure& failure) {
    sink.Append(failure.message);
  }

  friend std::ostream& operator<<(std::ostream& os, const Failure& failure) {
    return os << failure.message;
  }
};

// Renders message template arguments.
inline std::string FormatArgument(const Value& value) {
  return value.DebugString();
}
inline std::string FormatArgument(absl::string_view text) {
  return std::string(text);
}
inline std::string FormatArgument(const std::string& text) { return text; }
inline std::string FormatArgument(const char* text) { return text; }
inline std::string FormatArgument(const Type& type) { return type.name(); }
inline std::string FormatArgument(bool value) {
  return value ? "true" : "false";
}
template <typename T>
std::string FormatArgument(const T& value) {
  return absl::StrCat(value);
}

// Collects failures instead of stopping at the first one.
//
// A root scope owns the failures of a whole traversal. A nested scope is
// opened for every node; it knows the node path and the context description
// used for `{context:...}` placeholders, and moves its failures into the
// parent when it is destroyed. Scopes must be destroyed in reverse order of
// creation.
//
// Message templates support:
//   {0}, {1}, ...      the arguments passed to FailWith,
//   {context:Label}    the context description, or `Label` at the root,
//   {reason}           " because <reason>" if a reason was given.
class AssertionScope {
 public:
  explicit AssertionScope(std::string context = "");
  AssertionScope(AssertionScope& parent, std::string path,
                 std::string context);

  AssertionScope(const AssertionScope&) = delete;
  AssertionScope& operator=(const AssertionScope&) = delete;

  ~AssertionScope();

  // Sets the reason inserted at `{reason}`. Nested scopes inherit it.
  AssertionScope& BecauseOf(absl::string_view reason);
  const std::string& reason() const { return reason_; }

  const std::string& path() const { return path_; }
  const std::string& context() const { return context_; }

  // Makes the next FailWith record a failure only if `condition` is false.
  AssertionScope& ForCondition(bool condition) {
    condition_ = condition;
    return *this;
  }

  // Records a failure unless the preceding ForCondition held. Returns the
  // condition, true meaning no failure was recorded.
  template <typename... Args>
  bool FailWith(absl::string_view message_template, const Args&... args) {
    return FailWithArgs(message_template, {FormatArgument(args)...});
  }

  // Adds failures collected somewhere else, keeping their paths.
  void AddFailures(std::vector<Failure> failures);

  bool HasFailures() const { return !failures_.empty(); }
  const std::vector<Failure>& failures() const { return failures_; }

  // Takes the failures out of the scope, so that they are not reported to
  // the parent.
  std::vector<Failure> Discard() { return std::exchange(failures_, {}); }

 private:
  bool FailWithArgs(absl::string_view message_template,
                    std::vector<std::string> args);

  std::string Format(absl::string_view message_template,
                     const std::vector<std::string>& args) const;

  AssertionScope* parent_ = nullptr;
  std::string path_;
  std::string context_;
  std::string reason_;
  std::optional<bool> condition_;
  std::vector<Failure> failures_;
};

}  // namespace equivalency

#endif  // EQUIVALENCY_ASSERTION_SCOPE_H_

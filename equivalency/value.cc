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
#include "equivalency/value.h"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "equivalency/type.h"

namespace equivalency {

std::string Object::DebugString() const { return GetType().name(); }

const Type& Value::GetType() const {
  return VisitValue([](const auto& v) -> const Type& {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return NullType();
    } else if constexpr (std::is_same_v<T, bool>) {
      return BoolType();
    } else if constexpr (std::is_same_v<T, int64_t>) {
      return Int64Type();
    } else if constexpr (std::is_same_v<T, double>) {
      return DoubleType();
    } else if constexpr (std::is_same_v<T, std::string>) {
      return StringType();
    } else {
      return v->GetType();
    }
  });
}

std::string Value::DebugString() const {
  return VisitValue([](const auto& v) -> std::string {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return "<null>";
    } else if constexpr (std::is_same_v<T, bool>) {
      return v ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return absl::StrCat("\"", absl::CHexEscape(v), "\"");
    } else if constexpr (std::is_same_v<T, ObjectPtr>) {
      return v->DebugString();
    } else {
      return absl::StrCat(v);
    }
  });
}

std::string ValueText(const Value& value) {
  if (value.holds_value<std::string>()) {
    return value.value<std::string>();
  }
  return value.DebugString();
}

}  // namespace equivalency

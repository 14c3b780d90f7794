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
#ifndef EQUIVALENCY_VALUE_H_
#define EQUIVALENCY_VALUE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "absl/hash/hash.h"
#include "absl/strings/string_view.h"

namespace equivalency {

class Type;

// Base class of every reference-typed node of an object graph.
//
// Objects are shared between graphs through `ObjectPtr` and compared by
// identity unless an equivalency step knows how to look inside them.
class Object {
 public:
  virtual ~Object() = default;

  virtual const Type& GetType() const = 0;

  // Short human readable representation, used in failure messages. Must not
  // recurse into the object graph.
  virtual std::string DebugString() const;
};

using ObjectPtr = std::shared_ptr<const Object>;

// A single runtime value of an object graph: either missing (null), a scalar
// or a reference to an Object.
class Value {
 public:
  Value() = default;

  explicit Value(bool value) : data_(value) {}
  explicit Value(int value) : data_(int64_t{value}) {}
  explicit Value(int64_t value) : data_(value) {}
  explicit Value(double value) : data_(value) {}
  explicit Value(std::string value) : data_(std::move(value)) {}
  explicit Value(const char* value) : data_(std::string(value)) {}
  explicit Value(absl::string_view value) : data_(std::string(value)) {}

  template <class T,
            class = std::enable_if_t<std::is_base_of_v<Object, T>>>
  explicit Value(std::shared_ptr<T> object) {
    if (object != nullptr) {
      data_ = ObjectPtr(std::move(object));
    }
  }

  // Returns true if the Value is missing.
  bool is_null() const { return std::holds_alternative<std::monostate>(data_); }

  bool is_object() const { return std::holds_alternative<ObjectPtr>(data_); }

  // Returns true if the Value has value of given type.
  template <typename T>
  bool holds_value() const {
    static_assert(!std::is_same_v<T, std::monostate>);
    return std::holds_alternative<T>(data_);
  }

  // Returns value of given type. Has no type check. Check the value with
  // `holds_value` first.
  template <class T>
  const T& value() const {
    return std::get<T>(data_);
  }

  // Returns the referenced object or nullptr for scalars and nulls.
  const Object* object() const {
    if (const ObjectPtr* ptr = std::get_if<ObjectPtr>(&data_)) {
      return ptr->get();
    }
    return nullptr;
  }

  // Returns the referenced object as T, or nullptr if the value does not
  // reference a T.
  template <class T>
  const T* As() const {
    return dynamic_cast<const T*>(object());
  }

  // Returns the runtime type of the value. Null values have the null type.
  const Type& GetType() const;

  // Call visitor with the stored alternative. Nulls are passed as
  // std::monostate.
  template <class Visitor>
  decltype(auto) VisitValue(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), data_);
  }

  std::string DebugString() const;

  // Scalars are compared by value, objects by identity.
  bool operator==(const Value& other) const { return data_ == other.data_; }
  bool operator!=(const Value& other) const { return !(*this == other); }

  template <typename H>
  friend H AbslHashValue(H h, const Value& value) {
    return std::visit(
        [&](const auto& v) -> H {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::monostate>) {
            return H::combine(std::move(h), value.data_.index());
          } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            return H::combine(std::move(h), value.data_.index(), v.get());
          } else {
            return H::combine(std::move(h), value.data_.index(), v);
          }
        },
        value.data_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Value& value) {
    sink.Append(value.DebugString());
  }

  friend std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.DebugString();
  }

 private:
  std::variant<std::monostate, bool, int64_t, double, std::string, ObjectPtr>
      data_;
};

// Returns the text of a scalar without quoting, e.g. for use inside
// already quoted message templates. Objects and nulls use DebugString.
std::string ValueText(const Value& value);

}  // namespace equivalency

#endif  // EQUIVALENCY_VALUE_H_

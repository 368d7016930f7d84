#pragma once
#include <glaze/json/generic.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

// Lookups over upstream payloads whose shape is not guaranteed. None of these
// throw; a wrong type anywhere on the path reads as absent.
namespace cricket::core::json {

using Object = glz::generic::object_t;
using Array = glz::generic::array_t;

inline const glz::generic *
member(const glz::generic &Value, std::string_view Key) {
  const auto *Obj = std::get_if<Object>(&Value.data);
  if (Obj == nullptr) {
    return nullptr;
  }
  auto It = Obj->find(Key);
  return It == Obj->end() ? nullptr : &It->second;
}

inline const glz::generic *
member(const glz::generic *Value, std::string_view Key) {
  return Value == nullptr ? nullptr : member(*Value, Key);
}

inline const Array *asArray(const glz::generic *Value) {
  return Value == nullptr ? nullptr : std::get_if<Array>(&Value->data);
}

inline std::optional<std::string> asString(const glz::generic *Value) {
  if (Value == nullptr) {
    return std::nullopt;
  }
  if (const auto *Str = std::get_if<std::string>(&Value->data)) {
    return *Str;
  }
  return std::nullopt;
}

// Null, false, zero, "" and empty containers are falsy.
inline bool truthy(const glz::generic *Value) {
  if (Value == nullptr) {
    return false;
  }
  return std::visit(
      [](const auto &Held) -> bool {
        using T = std::decay_t<decltype(Held)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return false;
        } else if constexpr (std::is_same_v<T, bool>) {
          return Held;
        } else if constexpr (std::is_arithmetic_v<T>) {
          return Held != 0;
        } else {
          return !Held.empty();
        }
      },
      Value->data
  );
}

// Copy of the value, or null when absent.
inline glz::generic copyOrNull(const glz::generic *Value) {
  return Value == nullptr ? glz::generic{} : *Value;
}

inline glz::generic emptyArray() {
  glz::generic Value;
  Value.data = Array{};
  return Value;
}

} // namespace cricket::core::json

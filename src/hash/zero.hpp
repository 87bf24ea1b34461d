#pragma once

#include <algorithm>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <variant>

#include "hash/capabilities.hpp"
#include "hash/kinds.hpp"
#include "hash/optional.hpp"
#include "hash/record.hpp"

namespace sh::hash {

/// True when `value` equals the zero value of its type: 0, false, empty text,
/// absent reference or optional, empty box or container, all-zero array or
/// record.
template <typename T>
auto is_zero(const T& value) -> bool {
  if constexpr (CustomVisited<T>) {
    return custom_visitor<T>::is_zero(value);
  } else if constexpr (OptionalValue<T>) {
    return is_zero_payload(optional_payload(value));
  } else if constexpr (CString<T>) {
    return value == nullptr || *value == '\0';
  } else if constexpr (Reference<T>) {
    return detail::reference_traits<T>::get(value) == nullptr;
  } else if constexpr (DynamicBox<T>) {
    return !static_cast<bool>(value);
  } else if constexpr (Variant<T>) {
    if (value.valueless_by_exception()) {
      return true;
    }
    return std::visit(
        [](const auto& alternative) { return std::is_same_v<std::decay_t<decltype(alternative)>, std::monostate>; },
        value);
  } else if constexpr (std::is_same_v<T, std::monostate>) {
    return true;
  } else if constexpr (Scalar<T> || Complex<T> || Timestamp<T>) {
    return value == T{};
  } else if constexpr (Text<T>) {
    return value.empty();
  } else if constexpr (CharArray<T>) {
    return value[0] == '\0';
  } else if constexpr (Record<T>) {
    return record_traits<T>::describe().for_each_field(
        [&](const auto& field) { return is_zero(field.get(value)); });
  } else if constexpr (SelfHashing<T>) {
    return false;
  } else if constexpr (FixedArray<T>) {
    return std::ranges::all_of(value, [](const auto& item) { return is_zero(item); });
  } else if constexpr (TupleLike<T>) {
    return std::apply([](const auto&... items) { return (is_zero(items) && ...); }, value);
  } else if constexpr (std::ranges::input_range<const T>) {
    return std::ranges::begin(value) == std::ranges::end(value);
  } else {
    static_assert(detail::dependent_false_v<T>, "type has no structhash encoding");
  }
}

}  // namespace sh::hash

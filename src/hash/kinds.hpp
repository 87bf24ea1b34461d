#pragma once

#include <array>
#include <chrono>
#include <complex>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <entt/entt.hpp>

namespace sh::hash {

/// Opt-in encoding for foreign value types. Specialize with
/// `static auto visit(Walker&, const T&, const VisitContext*) -> Expected<void>`
/// and `static auto is_zero(const T&) -> bool`.
template <typename T>
struct custom_visitor;

namespace detail {

template <typename T>
inline constexpr bool dependent_false_v = false;

template <typename T>
struct reference_traits {
  static constexpr bool value = false;
};

template <typename T>
struct reference_traits<T*> {
  static constexpr bool value = !std::is_void_v<T> && !std::is_function_v<T>;
  using value_type = std::remove_cv_t<T>;
  static auto get(T* ptr) -> const value_type* { return ptr; }
};

template <typename T, typename D>
struct reference_traits<std::unique_ptr<T, D>> {
  static constexpr bool value = true;
  using value_type = std::remove_cv_t<T>;
  static auto get(const std::unique_ptr<T, D>& ptr) -> const value_type* { return ptr.get(); }
};

template <typename T>
struct reference_traits<std::shared_ptr<T>> {
  static constexpr bool value = true;
  using value_type = std::remove_cv_t<T>;
  static auto get(const std::shared_ptr<T>& ptr) -> const value_type* { return ptr.get(); }
};

template <typename T>
struct reference_traits<std::optional<T>> {
  static constexpr bool value = true;
  using value_type = T;
  static auto get(const std::optional<T>& opt) -> const value_type* {
    return opt.has_value() ? &*opt : nullptr;
  }
};

template <typename T>
struct is_variant : std::false_type {};

template <typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T>
struct is_complex : std::false_type {};

template <typename T>
struct is_complex<std::complex<T>> : std::true_type {};

template <typename T>
struct is_system_time : std::false_type {};

template <typename D>
struct is_system_time<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type {};

template <typename T>
struct is_std_array : std::false_type {};

template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T>
struct is_tuple_like : std::false_type {};

template <typename A, typename B>
struct is_tuple_like<std::pair<A, B>> : std::true_type {};

template <typename... Ts>
struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};

}  // namespace detail

template <typename T>
concept CustomVisited = requires { &custom_visitor<T>::visit; };

template <typename T>
concept CString = std::same_as<T, const char*> || std::same_as<T, char*>;

template <typename T>
concept CharArray = std::is_array_v<T> && std::same_as<std::remove_cv_t<std::remove_extent_t<T>>, char>;

template <typename T>
concept Text = std::same_as<T, std::string> || std::same_as<T, std::string_view>;

/// Indirection layer that may be absent: pointers, smart pointers, std::optional.
template <typename T>
concept Reference = detail::reference_traits<T>::value && !CString<T>;

template <typename T>
using referenced_t = typename detail::reference_traits<T>::value_type;

template <typename T>
concept DynamicBox = std::same_as<T, entt::meta_any>;

template <typename T>
concept Variant = detail::is_variant<T>::value;

template <typename T>
concept Scalar = std::is_arithmetic_v<T> || std::is_enum_v<T>;

template <typename T>
concept Complex = detail::is_complex<T>::value;

template <typename T>
concept Timestamp = detail::is_system_time<T>::value;

template <typename T>
concept FixedArray = (std::is_array_v<T> && !CharArray<T>) || detail::is_std_array<T>::value;

template <typename T>
concept TupleLike = detail::is_tuple_like<T>::value;

template <typename T>
concept KeyedCollection = std::ranges::input_range<const T> && requires {
  typename T::key_type;
  typename T::mapped_type;
};

/// Associative containers without mapped values: always order-independent.
template <typename T>
concept SetCollection = std::ranges::input_range<const T> && !KeyedCollection<T> && requires {
  typename T::key_type;
};

template <typename T>
concept Sequence = std::ranges::input_range<const T> && !Text<T> && !KeyedCollection<T> &&
                   !SetCollection<T> && !FixedArray<T>;

}  // namespace sh::hash

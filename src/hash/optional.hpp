#pragma once

#include <complex>
#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "hash/digest.hpp"
#include "hash/error.hpp"
#include "hash/options.hpp"

namespace sh::hash {

/// Closed set of kinds offered by the external optional-value family.
enum class OptionalKind : std::uint8_t {
  String,
  Error,
  Bool,
  Int,
  Int8,
  Int16,
  Int32,
  Int64,
  Rune,
  Byte,
  Uint,
  Uint8,
  Uint16,
  Uint32,
  Uint64,
  Uintptr,
  Float32,
  Float64,
  Complex64,
  Complex128,
};

/// Adapter for one optional-value type. Specialize with
///   static constexpr OptionalKind kind;
///   static auto present(const T&) -> bool;
///   static auto value(const T&) -> <payload>;
/// Text kinds return something convertible to std::string (Error may instead
/// return a type with message()); numeric kinds return their scalar.
template <typename T>
struct optional_traits;

template <typename T>
concept OptionalValue = requires(const T& value) {
  { optional_traits<T>::kind } -> std::convertible_to<OptionalKind>;
  { optional_traits<T>::present(value) } -> std::convertible_to<bool>;
  optional_traits<T>::value(value);
};

/// Payload of a present optional, normalized to the canonical width of its family.
using OptionalPayload =
    std::variant<std::monostate, std::string, bool, std::int64_t, std::uint64_t, double, std::complex<double>>;

constexpr auto is_signed_kind(OptionalKind kind) -> bool {
  switch (kind) {
    case OptionalKind::Int:
    case OptionalKind::Int8:
    case OptionalKind::Int16:
    case OptionalKind::Int32:
    case OptionalKind::Int64:
    case OptionalKind::Rune:
      return true;
    default:
      return false;
  }
}

constexpr auto is_unsigned_kind(OptionalKind kind) -> bool {
  switch (kind) {
    case OptionalKind::Byte:
    case OptionalKind::Uint:
    case OptionalKind::Uint8:
    case OptionalKind::Uint16:
    case OptionalKind::Uint32:
    case OptionalKind::Uint64:
    case OptionalKind::Uintptr:
      return true;
    default:
      return false;
  }
}

constexpr auto is_float_kind(OptionalKind kind) -> bool {
  return kind == OptionalKind::Float32 || kind == OptionalKind::Float64;
}

constexpr auto is_complex_kind(OptionalKind kind) -> bool {
  return kind == OptionalKind::Complex64 || kind == OptionalKind::Complex128;
}

namespace detail {

template <OptionalKind Kind, typename V>
auto make_optional_payload(const V& value) -> OptionalPayload {
  if constexpr (Kind == OptionalKind::String) {
    return std::string(value);
  } else if constexpr (Kind == OptionalKind::Error) {
    if constexpr (requires { value.message(); }) {
      return std::string(value.message());
    } else {
      return std::string(value);
    }
  } else if constexpr (Kind == OptionalKind::Bool) {
    return static_cast<bool>(value);
  } else if constexpr (is_signed_kind(Kind)) {
    return static_cast<std::int64_t>(value);
  } else if constexpr (is_unsigned_kind(Kind)) {
    return static_cast<std::uint64_t>(value);
  } else if constexpr (is_float_kind(Kind)) {
    return static_cast<double>(value);
  } else {
    static_assert(is_complex_kind(Kind), "unhandled optional kind");
    return std::complex<double>(static_cast<double>(value.real()), static_cast<double>(value.imag()));
  }
}

}  // namespace detail

/// Present payload of `value`, std::monostate when absent.
template <OptionalValue T>
auto optional_payload(const T& value) -> OptionalPayload {
  using traits = optional_traits<T>;
  if (!traits::present(value)) {
    return std::monostate{};
  }
  return detail::make_optional_payload<traits::kind>(traits::value(value));
}

/// True for an absent payload or one equal to its family's zero.
auto is_zero_payload(const OptionalPayload& payload) -> bool;

/// Write one optional value. Absent values hash as the kind's zero when
/// zero_nil is set and as the text "nil" otherwise; zero and absent values
/// contribute nothing under ignore_zero_value.
auto encode_optional(DigestSink& sink, OptionalKind kind, const OptionalPayload& payload,
                     const HashOptions& options) -> Expected<void>;

}  // namespace sh::hash

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace sh::hash {

enum class HashErrc {
  InvalidFormat,
  NotStringer,
  UnsupportedKind,
  Hook,
  Digest,
};

struct HashError {
  HashErrc code = HashErrc::Hook;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, HashError>;

inline auto make_error(HashErrc code, std::string message) -> HashError {
  return HashError{code, std::move(message)};
}

/// Errors raised by user hooks default to HashErrc::Hook.
inline auto make_error(std::string message) -> HashError {
  return HashError{HashErrc::Hook, std::move(message)};
}

constexpr auto to_string(HashErrc code) -> std::string_view {
  switch (code) {
    case HashErrc::InvalidFormat:
      return "invalid format";
    case HashErrc::NotStringer:
      return "not text-renderable";
    case HashErrc::UnsupportedKind:
      return "unsupported value kind";
    case HashErrc::Hook:
      return "hook error";
    case HashErrc::Digest:
      return "digest error";
  }
  return "unknown";
}

}  // namespace sh::hash

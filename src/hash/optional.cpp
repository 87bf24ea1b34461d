#include "hash/optional.hpp"

#include <format>
#include <string_view>
#include <type_traits>

#include "hash/encoding.hpp"

namespace sh::hash {
namespace {

constexpr std::string_view kNil = "nil";

auto zero_payload(OptionalKind kind) -> OptionalPayload {
  switch (kind) {
    case OptionalKind::String:
    case OptionalKind::Error:
      return std::string{};
    case OptionalKind::Bool:
      return false;
    default:
      break;
  }
  if (is_signed_kind(kind)) {
    return std::int64_t{0};
  }
  if (is_unsigned_kind(kind)) {
    return std::uint64_t{0};
  }
  if (is_float_kind(kind)) {
    return 0.0;
  }
  return std::complex<double>{};
}

auto mismatch(OptionalKind kind) -> HashError {
  return make_error(HashErrc::UnsupportedKind,
                    std::format("optional payload does not match kind {}", static_cast<int>(kind)));
}

auto write_payload(DigestSink& sink, OptionalKind kind, const OptionalPayload& payload) -> Expected<void> {
  switch (kind) {
    case OptionalKind::String:
    case OptionalKind::Error: {
      const auto* text = std::get_if<std::string>(&payload);
      if (!text) {
        return tl::unexpected(mismatch(kind));
      }
      // The prefix keeps any present text distinct from the absent marker.
      write_text(sink, kind == OptionalKind::String ? "string" : "error");
      write_text(sink, *text);
      return {};
    }
    case OptionalKind::Bool: {
      const auto* flag = std::get_if<bool>(&payload);
      if (!flag) {
        return tl::unexpected(mismatch(kind));
      }
      write_text(sink, *flag ? "true" : "false");
      return {};
    }
    default:
      break;
  }

  if (is_signed_kind(kind)) {
    if (const auto* value = std::get_if<std::int64_t>(&payload)) {
      write_i64(sink, *value);
      return {};
    }
  } else if (is_unsigned_kind(kind)) {
    if (const auto* value = std::get_if<std::uint64_t>(&payload)) {
      write_u64(sink, *value);
      return {};
    }
  } else if (is_float_kind(kind)) {
    if (const auto* value = std::get_if<double>(&payload)) {
      write_f64(sink, *value);
      return {};
    }
  } else if (is_complex_kind(kind)) {
    if (const auto* value = std::get_if<std::complex<double>>(&payload)) {
      write_f64(sink, value->real());
      write_f64(sink, value->imag());
      return {};
    }
  }
  return tl::unexpected(mismatch(kind));
}

}  // namespace

auto is_zero_payload(const OptionalPayload& payload) -> bool {
  return std::visit(
      [](const auto& value) -> bool {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          return true;
        } else if constexpr (std::is_same_v<V, std::string>) {
          return value.empty();
        } else {
          return value == V{};
        }
      },
      payload);
}

auto encode_optional(DigestSink& sink, OptionalKind kind, const OptionalPayload& payload,
                     const HashOptions& options) -> Expected<void> {
  const bool present = !std::holds_alternative<std::monostate>(payload);
  if (options.ignore_zero_value && is_zero_payload(payload)) {
    return {};
  }
  if (!present) {
    if (options.zero_nil) {
      return write_payload(sink, kind, zero_payload(kind));
    }
    // Present encodings are prefixed text, "true"/"false" or 8/16 byte
    // words, none of which equals the three-byte marker.
    write_text(sink, kNil);
    return {};
  }
  return write_payload(sink, kind, payload);
}

}  // namespace sh::hash

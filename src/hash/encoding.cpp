#include "hash/encoding.hpp"

#include <bit>
#include <cstddef>
#include <cmath>
#include <limits>

namespace sh::hash {
namespace {

constexpr auto kTimestampVersion = std::uint8_t{0x01};
constexpr auto kUtcOffset = std::int16_t{-1};

/// Seconds between 0001-01-01 and 1970-01-01 in the proleptic Gregorian calendar.
constexpr auto kUnixToAbsolute = std::int64_t{62135596800};

auto write_u64_le(DigestSink& sink, std::uint64_t value) -> void {
  std::array<std::uint8_t, 8> bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
  }
  sink.write(bytes.data(), bytes.size());
}

auto canonicalize(double value) -> double {
  if (std::isnan(value)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (value == 0.0) {
    return 0.0;
  }
  return value;
}

template <std::size_t N, typename U>
auto put_be(TimestampBytes& out, std::size_t offset, U value) -> void {
  for (std::size_t i = 0; i < N; ++i) {
    out[offset + i] = static_cast<std::uint8_t>((value >> (8 * (N - 1 - i))) & 0xFFu);
  }
}

}  // namespace

auto write_i64(DigestSink& sink, std::int64_t value) -> void {
  write_u64_le(sink, static_cast<std::uint64_t>(value));
}

auto write_u64(DigestSink& sink, std::uint64_t value) -> void { write_u64_le(sink, value); }

auto write_f64(DigestSink& sink, double value) -> void {
  write_u64_le(sink, std::bit_cast<std::uint64_t>(canonicalize(value)));
}

auto write_bool(DigestSink& sink, bool value) -> void {
  const std::uint8_t byte = value ? 1 : 0;
  sink.write(&byte, 1);
}

auto write_text(DigestSink& sink, std::string_view text) -> void { sink.write(text); }

auto encode_timestamp(std::chrono::sys_seconds seconds, std::int32_t nanos) -> TimestampBytes {
  TimestampBytes out{};
  // Unsigned arithmetic wraps instead of overflowing near the clock limits.
  const auto absolute = static_cast<std::uint64_t>(seconds.time_since_epoch().count()) +
                        static_cast<std::uint64_t>(kUnixToAbsolute);
  out[0] = kTimestampVersion;
  put_be<8>(out, 1, absolute);
  put_be<4>(out, 9, static_cast<std::uint32_t>(nanos));
  put_be<2>(out, 13, static_cast<std::uint16_t>(kUtcOffset));
  return out;
}

}  // namespace sh::hash

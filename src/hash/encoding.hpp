#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

#include "hash/digest.hpp"

namespace sh::hash {

/// Canonical binary form of a UTC timestamp: version byte, big-endian seconds
/// since 0001-01-01, big-endian nanoseconds, big-endian zone offset (-1 = UTC).
using TimestampBytes = std::array<std::uint8_t, 15>;

auto write_i64(DigestSink& sink, std::int64_t value) -> void;
auto write_u64(DigestSink& sink, std::uint64_t value) -> void;

/// IEEE-754 binary64, little-endian; -0.0 and every NaN are canonicalized.
auto write_f64(DigestSink& sink, double value) -> void;

auto write_bool(DigestSink& sink, bool value) -> void;

/// Raw bytes, no length prefix.
auto write_text(DigestSink& sink, std::string_view text) -> void;

auto encode_timestamp(std::chrono::sys_seconds seconds, std::int32_t nanos) -> TimestampBytes;

template <typename Duration>
auto write_timestamp(DigestSink& sink, std::chrono::time_point<std::chrono::system_clock, Duration> tp)
    -> void {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - seconds).count();
  const auto bytes = encode_timestamp(seconds, static_cast<std::int32_t>(nanos));
  sink.write(bytes.data(), bytes.size());
}

}  // namespace sh::hash

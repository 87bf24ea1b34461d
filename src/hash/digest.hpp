#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hash/error.hpp"

namespace sh::hash {

/// Finalized digest bytes; the length is fixed by the Format.
using Digest = std::vector<std::uint8_t>;

/// Supported digest backends. Zero is reserved so an unset selector is rejected.
enum class Format : unsigned {
  Invalid = 0,
  Md5,     ///< 128-bit MD5
  Blake3,  ///< 256-bit BLAKE3
  Xxh3,    ///< 128-bit XXH3, non-cryptographic
  Max,
};

constexpr auto is_valid(Format format) -> bool {
  return format > Format::Invalid && format < Format::Max;
}

auto format_name(Format format) -> std::string_view;

/// Parse "md5", "blake3" or "xxh3" (case-sensitive).
auto parse_format(std::string_view name) -> Expected<Format>;

/// Output length in bytes, 0 for an invalid format.
auto digest_size(Format format) -> std::size_t;

/// Incremental hash accumulator.
class DigestSink {
 public:
  virtual ~DigestSink() = default;

  virtual auto write(const void* data, std::size_t size) -> void = 0;
  virtual auto finish() -> Expected<Digest> = 0;

  auto write(std::string_view bytes) -> void { write(bytes.data(), bytes.size()); }
};

auto make_sink(Format format) -> Expected<std::unique_ptr<DigestSink>>;

/// Lowercase hex rendering for logs and tools.
auto to_hex(const Digest& digest) -> std::string;

}  // namespace sh::hash

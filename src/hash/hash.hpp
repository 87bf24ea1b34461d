#pragma once

#include "hash/digest.hpp"
#include "hash/error.hpp"
#include "hash/options.hpp"
#include "hash/record.hpp"
#include "hash/tags.hpp"
#include "hash/walker.hpp"

namespace sh::hash {

/// Fails with HashErrc::InvalidFormat unless `format` is a supported backend.
auto validate_format(Format format) -> Expected<void>;

/// Feed the canonical encoding of `value` into a caller-owned sink. `format`
/// selects the backend for the independent digests of collection members.
template <typename T>
auto hash_into(DigestSink& sink, const T& value, Format format, const HashOptions* options = nullptr)
    -> Expected<void> {
  if (auto valid = validate_format(format); !valid) {
    return valid;
  }
  const auto resolved = resolve_options(options);
  Walker walker(sink, format, resolved);
  return walker.visit(value);
}

/// Deterministic digest of `value`. Values that differ only in keyed-collection
/// iteration order, in the order of set-tagged sequences, in ignored fields or
/// in unexported fields hash identically. A null `options` uses the defaults.
template <typename T>
auto hash(const T& value, Format format, const HashOptions* options = nullptr) -> Expected<Digest> {
  if (auto valid = validate_format(format); !valid) {
    return tl::unexpected(valid.error());
  }
  auto sink = make_sink(format);
  if (!sink) {
    return tl::unexpected(sink.error());
  }
  const auto resolved = resolve_options(options);
  Walker walker(**sink, format, resolved);
  if (auto visited = walker.visit(value); !visited) {
    return tl::unexpected(visited.error());
  }
  return (*sink)->finish();
}

}  // namespace sh::hash

#pragma once

#include <string>

#include "hash/tags.hpp"

namespace sh::hash {

/// Per-call hashing options. Read-only for the duration of a traversal.
struct HashOptions {
  /// Metadata key whose field tags are honored.
  std::string tag_name{kDefaultTagName};

  /// Hash an absent reference like the zero value of the referenced type.
  bool zero_nil = false;

  /// Skip record fields holding their type's zero value.
  bool ignore_zero_value = false;

  /// Treat every sequence as if its field were tagged as a set.
  bool slices_as_sets = false;

  /// Hash every text-renderable field through to_string(). A field tagged
  /// String still fails when the value cannot be rendered.
  bool use_stringer = false;
};

/// Copy `options` (or the defaults when null) and fill in an empty tag name.
auto resolve_options(const HashOptions* options) -> HashOptions;

}  // namespace sh::hash

#pragma once

#include <cstdint>
#include <string_view>

namespace sh::hash {

/// Metadata key consulted when no tag name is configured.
inline constexpr std::string_view kDefaultTagName = "hash";

/// Per-field behavior switch.
enum class FieldTag : std::uint8_t {
  None,
  Ignore,  ///< field never contributes
  Set,     ///< sequence hashed as an unordered set
  String,  ///< field hashed through its to_string()
};

/// Map the textual vocabulary ("ignore", "-", "set", "string") onto FieldTag.
constexpr auto parse_field_tag(std::string_view value) -> FieldTag {
  if (value == "ignore" || value == "-") {
    return FieldTag::Ignore;
  }
  if (value == "set") {
    return FieldTag::Set;
  }
  if (value == "string") {
    return FieldTag::String;
  }
  return FieldTag::None;
}

/// A FieldTag bound to the metadata key it answers to.
struct Tag {
  std::string_view key = kDefaultTagName;
  FieldTag value = FieldTag::None;
};

constexpr auto tag(std::string_view key, std::string_view value) -> Tag {
  return Tag{key, parse_field_tag(value)};
}

inline constexpr Tag ignore{kDefaultTagName, FieldTag::Ignore};
inline constexpr Tag as_set{kDefaultTagName, FieldTag::Set};
inline constexpr Tag as_string{kDefaultTagName, FieldTag::String};

}  // namespace sh::hash

#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include <entt/entt.hpp>

#include "hash/error.hpp"

namespace sh::hash {

/// Record replaces its whole traversal with the decimal text of this number.
template <typename T>
concept SelfHashing = requires(const T& value) {
  { value.hash_value() } -> std::same_as<Expected<std::uint64_t>>;
};

/// Record decides per visible field whether it contributes.
template <typename T>
concept FieldFiltering = requires(const T& value, std::string_view field, const entt::meta_any& item) {
  { value.hash_include(field, item) } -> std::same_as<Expected<bool>>;
};

/// Record decides per entry of a keyed-collection field whether it contributes.
template <typename T>
concept MapFiltering =
    requires(const T& value, std::string_view field, const entt::meta_any& key, const entt::meta_any& item) {
      { value.hash_include_map(field, key, item) } -> std::same_as<Expected<bool>>;
    };

template <typename T>
concept TextRenderable = requires(const T& value) {
  { value.to_string() } -> std::convertible_to<std::string>;
};

}  // namespace sh::hash

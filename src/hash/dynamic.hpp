#pragma once

#include <string_view>

#include <entt/entt.hpp>

#include "hash/error.hpp"
#include "hash/record.hpp"
#include "hash/walker.hpp"

namespace sh::hash {

/// Erased visit of an entt::meta_any known to hold a registered type.
using DynamicVisitFn = Expected<void> (*)(Walker& walker, const entt::meta_any& value, const VisitContext* ctx);

namespace detail {

template <typename T>
auto visit_erased(Walker& walker, const entt::meta_any& value, const VisitContext* ctx) -> Expected<void> {
  const auto* typed = value.try_cast<const T>();
  if (typed == nullptr) {
    return tl::unexpected(make_error(HashErrc::UnsupportedKind, "boxed value does not match its registered type"));
  }
  return walker.visit(*typed, ctx);
}

}  // namespace detail

/// Record the visitor for a type hash; false when it was already bound under
/// the same name. Throws std::runtime_error for a different name.
auto register_visitor(entt::id_type type_hash, std::string_view name, DynamicVisitFn visitor) -> bool;

/// Visitor registered for a type hash, nullptr when none.
auto find_visitor(entt::id_type type_hash) -> DynamicVisitFn;

/// Make T hashable when boxed in an entt::meta_any. The first registration of
/// a type writes the EnTT meta context and must not overlap hashing of boxed
/// values; repeated registrations only take the registry lock.
template <typename T>
auto register_type(std::string_view name) -> void {
  if (register_visitor(entt::type_id<T>().hash(), name, &detail::visit_erased<T>)) {
    entt::meta<T>().type(entt::hashed_string::value(name.data(), name.size()));
  }
}

template <Record T>
auto register_type() -> void {
  register_type<T>(record_traits<T>::describe().name());
}

/// Register scalars, text, timestamps and the common boxed containers.
auto register_builtin_types() -> void;

}  // namespace sh::hash

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "hash/capabilities.hpp"
#include "hash/digest.hpp"
#include "hash/encoding.hpp"
#include "hash/error.hpp"
#include "hash/kinds.hpp"
#include "hash/optional.hpp"
#include "hash/options.hpp"
#include "hash/record.hpp"
#include "hash/zero.hpp"

namespace sh::hash {

enum class VisitFlag : std::uint32_t {
  Set = 1u << 0,
};

using VisitFlags = std::uint32_t;

constexpr auto to_flags(VisitFlag flag) -> VisitFlags { return static_cast<VisitFlags>(flag); }

constexpr auto has_flag(VisitFlags flags, VisitFlag flag) -> bool { return (flags & to_flags(flag)) != 0; }

/// Key/value filter of the enclosing record, erased to its record pointer.
using MapFilterFn = Expected<bool> (*)(const void* record, std::string_view field, const entt::meta_any& key,
                                       const entt::meta_any& value);

/// State handed from a record field to the visit of its value. Lives on the
/// caller's stack for exactly one visit.
struct VisitContext {
  VisitFlags flags = 0;
  const void* record = nullptr;
  MapFilterFn include_map = nullptr;
  std::string_view field;
};

namespace detail {

/// Non-owning meta view of a value; boxes are forwarded as their payload.
template <typename T>
auto as_meta(const T& value) -> entt::meta_any {
  if constexpr (DynamicBox<T>) {
    return value.as_ref();
  } else {
    return entt::forward_as_meta(value);
  }
}

template <MapFiltering T>
auto invoke_map_filter(const void* record, std::string_view field, const entt::meta_any& key,
                       const entt::meta_any& value) -> Expected<bool> {
  return static_cast<const T*>(record)->hash_include_map(field, key, value);
}

}  // namespace detail

/// One recursive traversal feeding a single DigestSink. Keyed collections and
/// set-like sequences hash their members through independent child walkers.
class Walker {
 public:
  Walker(DigestSink& sink, Format format, const HashOptions& options)
      : sink_(sink), format_(format), options_(options) {}

  Walker(const Walker&) = delete;
  auto operator=(const Walker&) -> Walker& = delete;

  template <typename T>
  auto visit(const T& value, const VisitContext* ctx = nullptr) -> Expected<void> {
    if constexpr (CustomVisited<T>) {
      return custom_visitor<T>::visit(*this, value, ctx);
    } else if constexpr (OptionalValue<T>) {
      return encode_optional(sink_, optional_traits<T>::kind, optional_payload(value), options_);
    } else if constexpr (CString<T>) {
      if (value == nullptr) {
        return visit_absent<std::string>(ctx);
      }
      write_text(sink_, value);
      return {};
    } else if constexpr (Reference<T>) {
      if (const auto* target = detail::reference_traits<T>::get(value)) {
        return visit(*target, ctx);
      }
      return visit_absent<referenced_t<T>>(ctx);
    } else if constexpr (DynamicBox<T>) {
      return visit_any(value, ctx);
    } else if constexpr (Variant<T>) {
      if (value.valueless_by_exception()) {
        return visit_absent<void>(ctx);
      }
      return std::visit([&](const auto& alternative) { return visit(alternative, ctx); }, value);
    } else if constexpr (std::is_same_v<T, std::monostate>) {
      return visit_absent<void>(ctx);
    } else if constexpr (std::is_same_v<T, bool>) {
      write_bool(sink_, value);
      return {};
    } else if constexpr (std::is_same_v<T, char>) {
      // Plain char is a byte on every platform.
      write_u64(sink_, static_cast<unsigned char>(value));
      return {};
    } else if constexpr (std::is_enum_v<T>) {
      return visit(static_cast<std::underlying_type_t<T>>(value), ctx);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
      write_i64(sink_, static_cast<std::int64_t>(value));
      return {};
    } else if constexpr (std::is_integral_v<T>) {
      write_u64(sink_, static_cast<std::uint64_t>(value));
      return {};
    } else if constexpr (std::is_floating_point_v<T>) {
      write_f64(sink_, static_cast<double>(value));
      return {};
    } else if constexpr (Complex<T>) {
      write_f64(sink_, static_cast<double>(value.real()));
      write_f64(sink_, static_cast<double>(value.imag()));
      return {};
    } else if constexpr (Timestamp<T>) {
      write_timestamp(sink_, value);
      return {};
    } else if constexpr (Text<T>) {
      write_text(sink_, value);
      return {};
    } else if constexpr (CharArray<T>) {
      const auto* end = std::find(std::begin(value), std::end(value), '\0');
      write_text(sink_, std::string_view(std::begin(value), static_cast<std::size_t>(end - std::begin(value))));
      return {};
    } else if constexpr (Record<T> || SelfHashing<T>) {
      return visit_record(value);
    } else if constexpr (KeyedCollection<T>) {
      return visit_map(value, ctx);
    } else if constexpr (SetCollection<T>) {
      return visit_set(value);
    } else if constexpr (FixedArray<T>) {
      for (const auto& item : value) {
        if (auto visited = visit(item); !visited) {
          return visited;
        }
      }
      return {};
    } else if constexpr (TupleLike<T>) {
      Expected<void> result{};
      std::apply([&](const auto&... items) { (static_cast<bool>(result = visit(items)) && ...); }, value);
      return result;
    } else if constexpr (Sequence<T>) {
      return visit_sequence(value, ctx);
    } else {
      static_assert(detail::dependent_false_v<T>, "type has no structhash encoding");
    }
  }

  /// Hash a type-erased value through the dynamic type registry.
  auto visit_any(const entt::meta_any& value, const VisitContext* ctx) -> Expected<void>;

  /// Absent value whose referenced type is T (void when unknown). With
  /// zero_nil the zero value of T is hashed; otherwise the canonical
  /// signed-integer zero stands in for the missing value. An absent T met
  /// while the zero value of T is already being hashed also writes the
  /// signed-integer zero, so self-referential types terminate.
  template <typename T>
  auto visit_absent(const VisitContext* ctx) -> Expected<void> {
    if constexpr (!std::is_void_v<T> && std::is_default_constructible_v<T>) {
      const auto type_hash = entt::type_id<T>().hash();
      const bool filling = std::find(zero_filling_.begin(), zero_filling_.end(), type_hash) != zero_filling_.end();
      if (options_.zero_nil && !filling) {
        zero_filling_.push_back(type_hash);
        auto visited = visit(T{}, ctx);
        zero_filling_.pop_back();
        return visited;
      }
    }
    write_i64(sink_, 0);
    return {};
  }

  /// Digest of `value` computed by an independent walker and sink.
  template <typename T>
  auto sub_hash(const T& value) -> Expected<Digest> {
    auto sink = make_sink(format_);
    if (!sink) {
      return tl::unexpected(sink.error());
    }
    Walker child(**sink, format_, options_);
    child.zero_filling_ = zero_filling_;
    if (auto visited = child.visit(value); !visited) {
      return tl::unexpected(visited.error());
    }
    return (*sink)->finish();
  }

 private:
  template <typename T>
  auto visit_record(const T& value) -> Expected<void> {
    if constexpr (SelfHashing<T>) {
      auto self = value.hash_value();
      if (!self) {
        return tl::unexpected(self.error());
      }
      write_text(sink_, std::to_string(*self));
      return {};
    } else {
      const auto desc = record_traits<T>::describe();
      write_text(sink_, desc.name());
      Expected<void> result{};
      desc.for_each_field([&](const auto& field) {
        result = visit_field(value, field);
        return result.has_value();
      });
      return result;
    }
  }

  template <typename T, typename M>
  auto visit_field(const T& record, const FieldDesc<T, M>& field) -> Expected<void> {
    if (field.visibility == Visibility::Unexported) {
      return {};
    }
    const auto tag = field.tag_for(options_.tag_name);
    if (tag == FieldTag::Ignore) {
      return {};
    }
    const M& value = field.get(record);
    if (options_.ignore_zero_value && is_zero(value)) {
      return {};
    }
    if (tag == FieldTag::String || options_.use_stringer) {
      if constexpr (TextRenderable<M>) {
        const std::string text = value.to_string();
        return visit_field_value(record, field.name, text, tag);
      } else if (tag == FieldTag::String) {
        return tl::unexpected(make_error(
            HashErrc::NotStringer,
            std::format("field {} of {} does not implement to_string", field.name,
                        record_traits<T>::describe().name())));
      }
    }
    return visit_field_value(record, field.name, value, tag);
  }

  template <typename T, typename V>
  auto visit_field_value(const T& record, std::string_view name, const V& value, FieldTag tag)
      -> Expected<void> {
    if constexpr (FieldFiltering<T>) {
      auto include = record.hash_include(name, detail::as_meta(value));
      if (!include) {
        return tl::unexpected(include.error());
      }
      if (!*include) {
        return {};
      }
    }

    VisitContext ctx;
    ctx.record = &record;
    ctx.field = name;
    if (tag == FieldTag::Set) {
      ctx.flags |= to_flags(VisitFlag::Set);
    }
    if constexpr (MapFiltering<T>) {
      ctx.include_map = &detail::invoke_map_filter<T>;
    }

    write_text(sink_, name);
    return visit(value, &ctx);
  }

  template <typename S>
  auto visit_sequence(const S& sequence, const VisitContext* ctx) -> Expected<void> {
    const bool as_set = options_.slices_as_sets || (ctx && has_flag(ctx->flags, VisitFlag::Set));
    if (as_set) {
      return visit_set(sequence);
    }
    for (const auto& item : sequence) {
      if (auto visited = visit(item); !visited) {
        return visited;
      }
    }
    return {};
  }

  template <typename S>
  auto visit_set(const S& items) -> Expected<void> {
    std::vector<Digest> digests;
    for (const auto& item : items) {
      auto digest = sub_hash(item);
      if (!digest) {
        return tl::unexpected(digest.error());
      }
      digests.push_back(std::move(*digest));
    }
    write_sorted(digests);
    return {};
  }

  template <typename M>
  auto visit_map(const M& map, const VisitContext* ctx) -> Expected<void> {
    const bool filtered = ctx != nullptr && ctx->include_map != nullptr;
    std::vector<Digest> keys;
    std::vector<Digest> values;
    for (const auto& [key, value] : map) {
      if (filtered) {
        auto include = ctx->include_map(ctx->record, ctx->field, detail::as_meta(key), detail::as_meta(value));
        if (!include) {
          return tl::unexpected(include.error());
        }
        if (!*include) {
          continue;
        }
      }
      auto key_digest = sub_hash(key);
      if (!key_digest) {
        return tl::unexpected(key_digest.error());
      }
      auto value_digest = sub_hash(value);
      if (!value_digest) {
        return tl::unexpected(value_digest.error());
      }
      keys.push_back(std::move(*key_digest));
      values.push_back(std::move(*value_digest));
    }
    write_sorted(keys);
    write_sorted(values);
    return {};
  }

  /// Sort digests byte-lexicographically and write them in order.
  auto write_sorted(std::vector<Digest>& digests) -> void;

  DigestSink& sink_;
  Format format_;
  const HashOptions& options_;
  std::vector<entt::id_type> zero_filling_;
};

}  // namespace sh::hash

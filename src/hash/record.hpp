#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <tuple>
#include <utility>

#include "hash/tags.hpp"

namespace sh::hash {

inline constexpr std::size_t kMaxFieldTags = 4;

enum class Visibility : std::uint8_t {
  Exported,
  Unexported,
};

/// One declared field of record type T with member type M.
template <typename T, typename M>
struct FieldDesc {
  using record_type = T;
  using member_type = M;

  std::string_view name;
  M T::*member = nullptr;
  Visibility visibility = Visibility::Exported;
  std::array<Tag, kMaxFieldTags> tags{};
  std::size_t tag_count = 0;

  constexpr auto get(const T& record) const -> const M& { return record.*member; }

  /// Tag registered under `key`, FieldTag::None when absent.
  constexpr auto tag_for(std::string_view key) const -> FieldTag {
    for (std::size_t i = 0; i < tag_count; ++i) {
      if (tags[i].key == key) {
        return tags[i].value;
      }
    }
    return FieldTag::None;
  }
};

/// Ordered field list of a record type, built fluently:
///
///   record<Point>("Point").field("X", &Point::x).field("Id", &Point::id, ignore)
template <typename T, typename... Fields>
class RecordDesc {
 public:
  constexpr explicit RecordDesc(std::string_view name, std::tuple<Fields...> fields = {})
      : name_(name), fields_(std::move(fields)) {}

  template <typename M, typename... Tags>
  constexpr auto field(std::string_view name, M T::*member, Tags... tags) const
      -> RecordDesc<T, Fields..., FieldDesc<T, M>> {
    static_assert(sizeof...(Tags) <= kMaxFieldTags, "too many tags on one field");
    FieldDesc<T, M> desc{name, member, Visibility::Exported, {Tag(tags)...}, sizeof...(Tags)};
    return append(desc);
  }

  /// Register a field that is part of the layout but not externally visible.
  template <typename M>
  constexpr auto unexported(std::string_view name, M T::*member) const
      -> RecordDesc<T, Fields..., FieldDesc<T, M>> {
    return append(FieldDesc<T, M>{name, member, Visibility::Unexported});
  }

  constexpr auto name() const -> std::string_view { return name_; }

  static constexpr auto size() -> std::size_t { return sizeof...(Fields); }

  /// Call fn on each field in declaration order until it returns false.
  template <typename Fn>
  constexpr auto for_each_field(Fn&& fn) const -> bool {
    return std::apply([&](const auto&... field) { return (fn(field) && ...); }, fields_);
  }

 private:
  template <typename Desc>
  constexpr auto append(Desc desc) const -> RecordDesc<T, Fields..., Desc> {
    return RecordDesc<T, Fields..., Desc>(
        name_, std::tuple_cat(fields_, std::make_tuple(std::move(desc))));
  }

  std::string_view name_;
  std::tuple<Fields...> fields_;
};

template <typename T>
constexpr auto record(std::string_view name) -> RecordDesc<T> {
  return RecordDesc<T>(name);
}

/// Specialize with `static auto describe()` returning a RecordDesc<T, ...>.
template <typename T>
struct record_traits;

template <typename T>
concept Record = requires {
  { record_traits<T>::describe().name() } -> std::convertible_to<std::string_view>;
};

}  // namespace sh::hash

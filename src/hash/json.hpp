#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "hash/walker.hpp"

namespace sh::hash {

/// JSON documents hash like the equivalent native graph: objects as keyed
/// collections, arrays as sequences, null as an absent value.
template <>
struct custom_visitor<nlohmann::json> {
  static auto visit(Walker& walker, const nlohmann::json& value, const VisitContext* ctx) -> Expected<void> {
    using json = nlohmann::json;
    switch (value.type()) {
      case json::value_t::object:
        return walker.visit(value.get_ref<const json::object_t&>(), ctx);
      case json::value_t::array:
        return walker.visit(value.get_ref<const json::array_t&>(), ctx);
      case json::value_t::string:
        return walker.visit(value.get_ref<const json::string_t&>(), ctx);
      case json::value_t::boolean:
        return walker.visit(value.get<bool>(), ctx);
      case json::value_t::number_integer:
        return walker.visit(value.get<std::int64_t>(), ctx);
      case json::value_t::number_unsigned:
        return walker.visit(value.get<std::uint64_t>(), ctx);
      case json::value_t::number_float:
        return walker.visit(value.get<double>(), ctx);
      case json::value_t::binary: {
        const std::vector<std::uint8_t>& bytes = value.get_binary();
        return walker.visit(bytes, ctx);
      }
      case json::value_t::null:
      case json::value_t::discarded:
        break;
    }
    return walker.visit_absent<void>(ctx);
  }

  static auto is_zero(const nlohmann::json& value) -> bool {
    using json = nlohmann::json;
    switch (value.type()) {
      case json::value_t::object:
      case json::value_t::array:
        return value.empty();
      case json::value_t::string:
        return value.get_ref<const json::string_t&>().empty();
      case json::value_t::boolean:
        return !value.get<bool>();
      case json::value_t::number_integer:
        return value.get<std::int64_t>() == 0;
      case json::value_t::number_unsigned:
        return value.get<std::uint64_t>() == 0;
      case json::value_t::number_float:
        return value.get<double>() == 0.0;
      case json::value_t::binary:
        return value.get_binary().empty();
      case json::value_t::null:
      case json::value_t::discarded:
        break;
    }
    return true;
  }
};

}  // namespace sh::hash

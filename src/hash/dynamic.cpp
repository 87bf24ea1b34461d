#include "hash/dynamic.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/logging/log.hpp"

namespace sh::hash {
namespace {

struct VisitorEntry {
  std::string name;
  DynamicVisitFn visitor = nullptr;
};

class VisitorRegistry {
 public:
  auto add(entt::id_type type_hash, std::string_view name, DynamicVisitFn visitor) -> bool {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(type_hash);
    if (it != entries_.end()) {
      if (it->second.name != name) {
        throw std::runtime_error("type already registered as " + it->second.name);
      }
      return false;
    }
    entries_.emplace(type_hash, VisitorEntry{std::string(name), visitor});
    sh::log::trace("registered hash visitor for {}", name);
    return true;
  }

  auto find(entt::id_type type_hash) const -> DynamicVisitFn {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(type_hash);
    return it != entries_.end() ? it->second.visitor : nullptr;
  }

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<entt::id_type, VisitorEntry> entries_;
};

auto registry() -> VisitorRegistry& {
  static VisitorRegistry instance;
  return instance;
}

}  // namespace

auto register_visitor(entt::id_type type_hash, std::string_view name, DynamicVisitFn visitor) -> bool {
  return registry().add(type_hash, name, visitor);
}

auto find_visitor(entt::id_type type_hash) -> DynamicVisitFn { return registry().find(type_hash); }

auto register_builtin_types() -> void {
  static std::once_flag once;
  std::call_once(once, [] {
    register_type<bool>("bool");
    register_type<char>("char");
    register_type<signed char>("signed char");
    register_type<short>("short");
    register_type<int>("int");
    register_type<long>("long");
    register_type<long long>("long long");
    register_type<unsigned char>("unsigned char");
    register_type<unsigned short>("unsigned short");
    register_type<unsigned int>("unsigned int");
    register_type<unsigned long>("unsigned long");
    register_type<unsigned long long>("unsigned long long");
    register_type<float>("float");
    register_type<double>("double");
    register_type<const char*>("const char*");
    register_type<std::string>("string");
    register_type<std::chrono::system_clock::time_point>("time_point");
    register_type<std::vector<std::string>>("vector<string>");
    register_type<std::vector<std::int64_t>>("vector<int64>");
    register_type<std::vector<double>>("vector<double>");
    register_type<std::vector<entt::meta_any>>("vector<any>");
    register_type<std::map<std::string, entt::meta_any>>("map<string,any>");
    register_type<std::unordered_map<std::string, entt::meta_any>>("unordered_map<string,any>");
  });
}

}  // namespace sh::hash

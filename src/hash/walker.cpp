#include "hash/walker.hpp"

#include "common/logging/log.hpp"
#include "hash/dynamic.hpp"

namespace sh::hash {

auto Walker::visit_any(const entt::meta_any& value, const VisitContext* ctx) -> Expected<void> {
  if (!value) {
    return visit_absent<void>(ctx);
  }
  const auto& info = value.type().info();
  auto visitor = find_visitor(info.hash());
  if (visitor == nullptr) {
    sh::log::debug("no hash visitor registered for boxed type {}", info.name());
    return tl::unexpected(make_error(HashErrc::UnsupportedKind,
                                     std::format("unknown kind to hash: {}", info.name())));
  }
  return visitor(*this, value, ctx);
}

auto Walker::write_sorted(std::vector<Digest>& digests) -> void {
  std::sort(digests.begin(), digests.end());
  for (const auto& digest : digests) {
    sink_.write(digest.data(), digest.size());
  }
}

}  // namespace sh::hash

#include "hash/hash.hpp"

#include <format>

#include "common/logging/log.hpp"

namespace sh::hash {

auto validate_format(Format format) -> Expected<void> {
  if (!is_valid(format)) {
    sh::log::debug("rejected hash format {}", static_cast<unsigned>(format));
    return tl::unexpected(make_error(
        HashErrc::InvalidFormat, std::format("invalid format: {}", static_cast<unsigned>(format))));
  }
  return {};
}

auto resolve_options(const HashOptions* options) -> HashOptions {
  HashOptions resolved = options != nullptr ? *options : HashOptions{};
  if (resolved.tag_name.empty()) {
    resolved.tag_name = std::string(kDefaultTagName);
  }
  return resolved;
}

}  // namespace sh::hash

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sh::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the default logger from the --log_* flags. Safe to call twice.
void init();

void shutdown();

/// Map a --log_level spelling onto spdlog; unknown names fall back to info.
auto parse_level(std::string_view level) -> spdlog::level::level_enum;

/// Emit `event` followed by key=value pairs in key order.
void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace sh::log

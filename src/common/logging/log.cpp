#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <vector>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_stderr);

namespace sh::log {
namespace {

constexpr std::size_t kMinFileSize = 1024;

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

auto make_sinks() -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  if (FLAGS_log_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!FLAGS_log_file.empty()) {
    const auto max_size = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)), kMinFileSize);
    const auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
    sinks.push_back(
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(FLAGS_log_file, max_size, max_files));
  }
  return sinks;
}

}  // namespace

auto parse_level(std::string_view level) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  auto sinks = make_sinks();
  g_logger = std::make_shared<spdlog::logger>("structhash", sinks.begin(), sinks.end());
  g_logger->set_level(parse_level(FLAGS_log_level));
  g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::set_default_logger(g_logger);

  spdlog::debug("logger initialized: file={}, level={}", FLAGS_log_file, FLAGS_log_level);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
  }
}

void info(std::string_view event, std::unordered_map<std::string, std::string> fields) {
  const std::map<std::string, std::string> ordered(fields.begin(), fields.end());
  std::string msg{event};
  for (const auto& [key, value] : ordered) {
    msg += " " + key + "=" + value;
  }
  spdlog::info(msg);
}

}  // namespace sh::log

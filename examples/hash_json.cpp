#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gflags/gflags.h>
#include <nlohmann/json.hpp>

#include "common/logging/log.hpp"
#include "hash/hash.hpp"
#include "hash/json.hpp"

DEFINE_string(format, "md5", "Digest backend (md5, blake3, xxh3)");
DEFINE_string(tag_name, "hash", "Field metadata key honored while hashing");
DEFINE_bool(zero_nil, false, "Hash null like the zero value of its type");
DEFINE_bool(ignore_zero_value, false, "Skip zero-valued fields");
DEFINE_bool(slices_as_sets, false, "Hash every array as an unordered set");
DEFINE_bool(use_stringer, false, "Hash text-renderable fields through to_string");
DEFINE_string(input, "-", "JSON document to hash; '-' reads stdin");

namespace {

auto read_input(const std::string& path) -> std::string {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

auto options_from_flags() -> sh::hash::HashOptions {
  sh::hash::HashOptions options;
  options.tag_name = FLAGS_tag_name;
  options.zero_nil = FLAGS_zero_nil;
  options.ignore_zero_value = FLAGS_ignore_zero_value;
  options.slices_as_sets = FLAGS_slices_as_sets;
  options.use_stringer = FLAGS_use_stringer;
  return options;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("structhash_json --format=md5 --input=doc.json");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sh::log::init();

  auto format = sh::hash::parse_format(FLAGS_format);
  if (!format) {
    sh::log::error("{}", format.error().message);
    return 2;
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(read_input(FLAGS_input));
  } catch (const std::exception& ex) {
    sh::log::error("failed to read input: {}", ex.what());
    return 1;
  }

  const auto options = options_from_flags();
  auto digest = sh::hash::hash(document, *format, &options);
  if (!digest) {
    sh::log::error("hash failed: {} ({})", digest.error().message, sh::hash::to_string(digest.error().code));
    return 1;
  }

  sh::log::info("hashed", {{"format", std::string(sh::hash::format_name(*format))},
                           {"input", FLAGS_input},
                           {"bytes", std::to_string(digest->size())}});
  std::cout << sh::hash::to_hex(*digest) << "\n";
  sh::log::shutdown();
  return 0;
}

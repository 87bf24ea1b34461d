#include "hash/digest.hpp"

#include <format>
#include <iterator>
#include <utility>

#include <openssl/evp.h>
#include <xxhash.h>

extern "C" {
#include <blake3.h>
}

namespace sh::hash {
namespace {

constexpr auto kMd5Size = std::size_t{16};
constexpr auto kBlake3Size = std::size_t{BLAKE3_OUT_LEN};
constexpr auto kXxh3Size = sizeof(XXH128_canonical_t);

class Md5Sink final : public DigestSink {
 public:
  Md5Sink() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ != nullptr && EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) == 1;
  }

  ~Md5Sink() override { EVP_MD_CTX_free(ctx_); }

  Md5Sink(const Md5Sink&) = delete;
  auto operator=(const Md5Sink&) -> Md5Sink& = delete;

  auto valid() const -> bool { return ok_; }

  auto write(const void* data, std::size_t size) -> void override {
    if (ok_ && size > 0) {
      ok_ = EVP_DigestUpdate(ctx_, data, size) == 1;
    }
  }

  auto finish() -> Expected<Digest> override {
    if (!ok_) {
      return tl::unexpected(make_error(HashErrc::Digest, "md5 digest update failed"));
    }
    Digest digest(kMd5Size);
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &length) != 1 || length != kMd5Size) {
      return tl::unexpected(make_error(HashErrc::Digest, "md5 digest finalization failed"));
    }
    return digest;
  }

 private:
  EVP_MD_CTX* ctx_ = nullptr;
  bool ok_ = false;
};

class Blake3Sink final : public DigestSink {
 public:
  Blake3Sink() { blake3_hasher_init(&hasher_); }

  auto write(const void* data, std::size_t size) -> void override {
    blake3_hasher_update(&hasher_, data, size);
  }

  auto finish() -> Expected<Digest> override {
    Digest digest(kBlake3Size);
    blake3_hasher_finalize(&hasher_, digest.data(), digest.size());
    return digest;
  }

 private:
  blake3_hasher hasher_;
};

class Xxh3Sink final : public DigestSink {
 public:
  Xxh3Sink() : state_(XXH3_createState()) {
    ok_ = state_ != nullptr && XXH3_128bits_reset(state_) == XXH_OK;
  }

  ~Xxh3Sink() override { XXH3_freeState(state_); }

  Xxh3Sink(const Xxh3Sink&) = delete;
  auto operator=(const Xxh3Sink&) -> Xxh3Sink& = delete;

  auto valid() const -> bool { return ok_; }

  auto write(const void* data, std::size_t size) -> void override {
    if (ok_) {
      ok_ = XXH3_128bits_update(state_, data, size) == XXH_OK;
    }
  }

  auto finish() -> Expected<Digest> override {
    if (!ok_) {
      return tl::unexpected(make_error(HashErrc::Digest, "xxh3 digest update failed"));
    }
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(state_));
    return Digest(std::begin(canonical.digest), std::end(canonical.digest));
  }

 private:
  XXH3_state_t* state_ = nullptr;
  bool ok_ = false;
};

}  // namespace

auto format_name(Format format) -> std::string_view {
  switch (format) {
    case Format::Md5:
      return "md5";
    case Format::Blake3:
      return "blake3";
    case Format::Xxh3:
      return "xxh3";
    case Format::Invalid:
    case Format::Max:
      break;
  }
  return "invalid";
}

auto parse_format(std::string_view name) -> Expected<Format> {
  for (auto format : {Format::Md5, Format::Blake3, Format::Xxh3}) {
    if (format_name(format) == name) {
      return format;
    }
  }
  return tl::unexpected(make_error(HashErrc::InvalidFormat, std::format("unknown format: {}", name)));
}

auto digest_size(Format format) -> std::size_t {
  switch (format) {
    case Format::Md5:
      return kMd5Size;
    case Format::Blake3:
      return kBlake3Size;
    case Format::Xxh3:
      return kXxh3Size;
    case Format::Invalid:
    case Format::Max:
      break;
  }
  return 0;
}

auto make_sink(Format format) -> Expected<std::unique_ptr<DigestSink>> {
  switch (format) {
    case Format::Md5: {
      auto sink = std::make_unique<Md5Sink>();
      if (!sink->valid()) {
        return tl::unexpected(make_error(HashErrc::Digest, "md5 digest initialization failed"));
      }
      return std::unique_ptr<DigestSink>{std::move(sink)};
    }
    case Format::Blake3:
      return std::unique_ptr<DigestSink>{std::make_unique<Blake3Sink>()};
    case Format::Xxh3: {
      auto sink = std::make_unique<Xxh3Sink>();
      if (!sink->valid()) {
        return tl::unexpected(make_error(HashErrc::Digest, "xxh3 digest initialization failed"));
      }
      return std::unique_ptr<DigestSink>{std::move(sink)};
    }
    case Format::Invalid:
    case Format::Max:
      break;
  }
  return tl::unexpected(make_error(
      HashErrc::InvalidFormat, std::format("invalid format: {}", static_cast<unsigned>(format))));
}

auto to_hex(const Digest& digest) -> std::string {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(digest.size() * 2);
  for (std::size_t i = 0; i < digest.size(); ++i) {
    out[2 * i] = kHex[(digest[i] >> 4) & 0xF];
    out[2 * i + 1] = kHex[digest[i] & 0xF];
  }
  return out;
}

}  // namespace sh::hash

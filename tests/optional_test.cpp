#include "hash/optional.hpp"

#include <complex>
#include <cstdint>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "hash/hash.hpp"
#include "test_support.hpp"

namespace {

using sh::hash::OptionalKind;

/// Minimal stand-in for an external nullable-value library.
template <typename T, OptionalKind Kind>
struct Opt {
  T value{};
  bool valid = false;
};

template <OptionalKind Kind, typename T>
auto some(T value) -> Opt<T, Kind> {
  return Opt<T, Kind>{std::move(value), true};
}

using OptString = Opt<std::string, OptionalKind::String>;
using OptError = Opt<std::error_code, OptionalKind::Error>;
using OptBool = Opt<bool, OptionalKind::Bool>;
using OptInt32 = Opt<std::int32_t, OptionalKind::Int32>;

struct Profile {
  OptString nickname;
  OptInt32 age;
  OptBool verified;
};

}  // namespace

namespace sh::hash {

template <typename T, OptionalKind Kind>
struct optional_traits<Opt<T, Kind>> {
  static constexpr OptionalKind kind = Kind;
  static auto present(const Opt<T, Kind>& opt) -> bool { return opt.valid; }
  static auto value(const Opt<T, Kind>& opt) -> const T& { return opt.value; }
};

template <>
struct record_traits<Profile> {
  static constexpr auto describe() {
    return record<Profile>("Profile")
        .field("Nickname", &Profile::nickname)
        .field("Age", &Profile::age)
        .field("Verified", &Profile::verified);
  }
};

}  // namespace sh::hash

TEST(Optional, PresentTextIsPrefixed) {
  EXPECT_EQ(canonical_bytes(some<OptionalKind::String>(std::string("hi"))), "stringhi");
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Error>(std::string("boom"))), "errorboom");

  const auto code = std::make_error_code(std::errc::invalid_argument);
  EXPECT_EQ(canonical_bytes(OptError{code, true}), "error" + code.message());
}

TEST(Optional, PresentEmptyTextDiffersFromAbsent) {
  EXPECT_EQ(canonical_bytes(OptString{"", true}), "string");
  EXPECT_EQ(canonical_bytes(OptString{}), "nil");
}

TEST(Optional, BoolIsText) {
  EXPECT_EQ(canonical_bytes(OptBool{true, true}), "true");
  EXPECT_EQ(canonical_bytes(OptBool{false, true}), "false");
  EXPECT_EQ(canonical_bytes(OptBool{}), "nil");
}

TEST(Optional, NumericKindsWiden) {
  EXPECT_EQ(canonical_bytes(OptInt32{5, true}), le64(5));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Int8>(std::int8_t{-1})), canonical_bytes(std::int64_t{-1}));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Rune>(char32_t{0x41})), le64(0x41));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Uint16>(std::uint16_t{65535})), le64(65535));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Byte>(std::uint8_t{7})), canonical_bytes(std::uint64_t{7}));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Float32>(1.5f)), canonical_bytes(1.5));
  EXPECT_EQ(canonical_bytes(some<OptionalKind::Complex64>(std::complex<float>(1.0f, 2.0f))),
            canonical_bytes(std::complex<double>(1.0, 2.0)));
}

TEST(Optional, AbsentWithZeroNilHashesKindZero) {
  sh::hash::HashOptions options;
  options.zero_nil = true;
  EXPECT_EQ(canonical_bytes(OptString{}, &options), "string");
  EXPECT_EQ(canonical_bytes(OptError{}, &options), "error");
  EXPECT_EQ(canonical_bytes(OptBool{}, &options), "false");
  EXPECT_EQ(canonical_bytes(OptInt32{}, &options), le64(0));
  EXPECT_EQ(canonical_bytes(Opt<double, OptionalKind::Float64>{}, &options), canonical_bytes(0.0));
  EXPECT_EQ(canonical_bytes(OptInt32{}, &options), canonical_bytes(OptInt32{0, true}, &options));
}

TEST(Optional, AbsentDiffersFromZeroByDefault) {
  EXPECT_NE(md5(OptInt32{}), md5(OptInt32{0, true}));
  EXPECT_NE(md5(OptString{}), md5(OptString{"", true}));
}

TEST(Optional, IgnoreZeroValueSkipsAbsentAndZero) {
  sh::hash::HashOptions options;
  options.ignore_zero_value = true;
  EXPECT_EQ(canonical_bytes(OptInt32{0, true}, &options), "");
  EXPECT_EQ(canonical_bytes(OptString{}, &options), "");
  EXPECT_EQ(canonical_bytes(OptString{"x", true}, &options), "stringx");

  const Profile sparse{OptString{}, OptInt32{0, true}, OptBool{true, true}};
  EXPECT_EQ(canonical_bytes(sparse, &options), std::string("Profile") + "Verified" + "true");
}

TEST(Optional, RecordFieldsUseOptionalEncoding) {
  const Profile profile{some<OptionalKind::String>(std::string("ace")), OptInt32{30, true}, OptBool{}};
  EXPECT_EQ(canonical_bytes(profile),
            std::string("Profile") + "Nickname" + "stringace" + "Age" + le64(30) + "Verified" + "nil");
}

TEST(Optional, PayloadMismatchIsUnsupported) {
  RecordingSink sink;
  sh::hash::HashOptions options;
  auto result = sh::hash::encode_optional(sink, OptionalKind::Int64, std::string("oops"), options);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, sh::hash::HashErrc::UnsupportedKind);
}

TEST(Optional, ZeroPayloadDetection) {
  EXPECT_TRUE(sh::hash::is_zero_payload(std::monostate{}));
  EXPECT_TRUE(sh::hash::is_zero_payload(std::string{}));
  EXPECT_TRUE(sh::hash::is_zero_payload(std::int64_t{0}));
  EXPECT_FALSE(sh::hash::is_zero_payload(std::uint64_t{3}));
  EXPECT_FALSE(sh::hash::is_zero_payload(true));
}

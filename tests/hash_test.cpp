#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <gtest/gtest.h>

#include "hash/hash.hpp"
#include "test_support.hpp"

namespace {

struct Tagged {
  std::string id;
  std::vector<int> members;
  std::vector<int> ordered;
};

struct Secretive {
  int visible = 0;
  int secret = 0;
};

struct Wrapper {
  Secretive inner;
  int count = 0;
};

struct Version {
  int major = 0;
  int minor = 0;

  auto to_string() const -> std::string { return std::to_string(major) + "." + std::to_string(minor); }
};

struct Release {
  std::string name;
  Version version;
};

struct Bundle {
  Version version;
};

struct Plain {
  int x = 0;
};

struct MustRender {
  Plain plain;
};

struct MultiTag {
  int a = 0;
  int b = 0;
};

struct Node {
  int value = 0;
  std::unique_ptr<Node> next;
};

struct Optionally {
  std::string name;
  fixtures::StructB* b = nullptr;
};

}  // namespace

namespace sh::hash {

template <>
struct record_traits<Tagged> {
  static constexpr auto describe() {
    return record<Tagged>("Tagged")
        .field("Id", &Tagged::id, ignore)
        .field("Members", &Tagged::members, as_set)
        .field("Ordered", &Tagged::ordered);
  }
};

template <>
struct record_traits<Secretive> {
  static constexpr auto describe() {
    return record<Secretive>("Secretive").field("Visible", &Secretive::visible).unexported("secret", &Secretive::secret);
  }
};

template <>
struct record_traits<Wrapper> {
  static constexpr auto describe() {
    return record<Wrapper>("Wrapper").field("Inner", &Wrapper::inner).field("Count", &Wrapper::count);
  }
};

template <>
struct record_traits<Version> {
  static constexpr auto describe() {
    return record<Version>("Version").field("Major", &Version::major).field("Minor", &Version::minor);
  }
};

template <>
struct record_traits<Release> {
  static constexpr auto describe() {
    return record<Release>("Release").field("Name", &Release::name).field("Version", &Release::version, as_string);
  }
};

template <>
struct record_traits<Bundle> {
  static constexpr auto describe() { return record<Bundle>("Bundle").field("Version", &Bundle::version); }
};

template <>
struct record_traits<Plain> {
  static constexpr auto describe() { return record<Plain>("Plain").field("X", &Plain::x); }
};

template <>
struct record_traits<MustRender> {
  static constexpr auto describe() {
    return record<MustRender>("MustRender").field("Plain", &MustRender::plain, as_string);
  }
};

template <>
struct record_traits<MultiTag> {
  static constexpr auto describe() {
    return record<MultiTag>("MultiTag")
        .field("A", &MultiTag::a, tag("custom", "ignore"))
        .field("B", &MultiTag::b, tag("hash", "-"));
  }
};

template <>
struct record_traits<Node> {
  static constexpr auto describe() { return record<Node>("Node").field("Value", &Node::value).field("Next", &Node::next); }
};

template <>
struct record_traits<Optionally> {
  static constexpr auto describe() {
    return record<Optionally>("Optionally").field("Name", &Optionally::name).field("B", &Optionally::b);
  }
};

}  // namespace sh::hash

TEST(Hash, Deterministic) {
  const auto value = fixtures::golden_a();
  EXPECT_EQ(md5(value), md5(value));
  EXPECT_FALSE(md5(value).empty());
}

TEST(Hash, RejectsInvalidFormat) {
  for (auto format : {sh::hash::Format::Invalid, sh::hash::Format::Max, static_cast<sh::hash::Format>(99)}) {
    auto digest = sh::hash::hash(fixtures::StructB{}, format);
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code, sh::hash::HashErrc::InvalidFormat);
  }
}

TEST(Hash, HashIntoRejectsInvalidFormatBeforeWriting) {
  RecordingSink sink;
  auto result = sh::hash::hash_into(sink, fixtures::StructB{1, true}, sh::hash::Format::Invalid);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, sh::hash::HashErrc::InvalidFormat);
  EXPECT_TRUE(sink.bytes().empty());
}

TEST(Hash, KeyedCollectionsIgnoreIterationOrder) {
  std::unordered_map<std::string, int> forward;
  std::unordered_map<std::string, int> backward;
  backward.reserve(128);
  for (int i = 0; i < 50; ++i) {
    forward.emplace("key" + std::to_string(i), i);
  }
  for (int i = 49; i >= 0; --i) {
    backward.emplace("key" + std::to_string(i), i);
  }
  EXPECT_EQ(md5(forward), md5(backward));

  std::map<std::string, int> ordered(forward.begin(), forward.end());
  EXPECT_EQ(md5(ordered), md5(forward));
}

TEST(Hash, KeysAndValuesSortIndependently) {
  const std::map<std::string, int> a{{"x", 1}, {"y", 2}};
  const std::map<std::string, int> b{{"x", 2}, {"y", 1}};
  EXPECT_EQ(md5(a), md5(b));
  const std::map<std::string, int> c{{"x", 1}, {"y", 3}};
  EXPECT_NE(md5(a), md5(c));
}

TEST(Hash, SetTaggedSequenceIgnoresOrder) {
  const Tagged a{"a", {1, 2, 3}, {1, 2, 3}};
  const Tagged b{"b", {3, 1, 2}, {1, 2, 3}};
  EXPECT_EQ(md5(a), md5(b));
}

TEST(Hash, UntaggedSequenceIsOrdered) {
  const Tagged a{"a", {1, 2, 3}, {1, 2, 3}};
  const Tagged b{"a", {1, 2, 3}, {3, 2, 1}};
  EXPECT_NE(md5(a), md5(b));
  EXPECT_NE(md5(std::vector<int>{1, 2}), md5(std::vector<int>{2, 1}));
}

TEST(Hash, SlicesAsSetsAppliesEverywhere) {
  sh::hash::HashOptions options;
  options.slices_as_sets = true;
  EXPECT_EQ(md5(std::vector<int>{1, 2, 3}, &options), md5(std::vector<int>{3, 2, 1}, &options));
  EXPECT_EQ(md5(std::deque<int>{4, 5}, &options), md5(std::list<int>{5, 4}, &options));

  const Tagged a{"a", {1}, {1, 2, 3}};
  const Tagged b{"a", {1}, {3, 2, 1}};
  EXPECT_EQ(md5(a, &options), md5(b, &options));
}

TEST(Hash, SetContainersAreAlwaysSets) {
  const std::set<int> ordered{1, 2, 3};
  const std::unordered_set<int> unordered{3, 2, 1};
  EXPECT_EQ(md5(ordered), md5(unordered));

  sh::hash::HashOptions options;
  options.slices_as_sets = true;
  EXPECT_EQ(md5(ordered), md5(std::vector<int>{2, 3, 1}, &options));
}

TEST(Hash, SetElementsAreDigestsNotRawValues) {
  const std::set<int> items{7};
  RecordingSink sink;
  ASSERT_TRUE(sh::hash::hash_into(sink, items, sh::hash::Format::Md5));
  EXPECT_EQ(sink.bytes().size(), sh::hash::digest_size(sh::hash::Format::Md5));
}

TEST(Hash, IgnoredFieldNeverContributes) {
  const Tagged a{"first", {1}, {2}};
  const Tagged b{"second", {1}, {2}};
  EXPECT_EQ(md5(a), md5(b));
}

TEST(Hash, UnexportedFieldNeverContributes) {
  EXPECT_EQ(md5(Secretive{1, 2}), md5(Secretive{1, 99}));
  EXPECT_NE(md5(Secretive{1, 2}), md5(Secretive{2, 2}));
  EXPECT_EQ(canonical_bytes(Secretive{1, 2}), std::string("Secretive") + "Visible" + le64(1));
}

TEST(Hash, UnexportedFieldCountsTowardZeroness) {
  sh::hash::HashOptions options;
  options.ignore_zero_value = true;
  const Wrapper all_zero{Secretive{0, 0}, 0};
  const Wrapper hidden_only{Secretive{0, 5}, 0};
  EXPECT_EQ(canonical_bytes(all_zero, &options), "Wrapper");
  EXPECT_EQ(canonical_bytes(hidden_only, &options), std::string("Wrapper") + "Inner" + "Secretive");
}

TEST(Hash, IgnoreZeroValueSkipsZeroFields) {
  sh::hash::HashOptions options;
  options.ignore_zero_value = true;
  EXPECT_EQ(canonical_bytes(fixtures::StructB{0, true}, &options), std::string("structB") + "B" + std::string(1, '\x01'));
  EXPECT_EQ(canonical_bytes(fixtures::StructB{}, &options), "structB");
  EXPECT_NE(md5(fixtures::StructB{}, &options), md5(fixtures::StructB{}));
}

TEST(Hash, StringTagUsesTextRendering) {
  const Release release{"core", Version{1, 2}};
  EXPECT_EQ(canonical_bytes(release), std::string("Release") + "Name" + "core" + "Version" + "1.2");
}

TEST(Hash, StringTagWithoutRenderingFails) {
  auto digest = sh::hash::hash(MustRender{Plain{3}}, sh::hash::Format::Md5);
  ASSERT_FALSE(digest.has_value());
  EXPECT_EQ(digest.error().code, sh::hash::HashErrc::NotStringer);
}

TEST(Hash, UseStringerRendersAnyRenderableField) {
  sh::hash::HashOptions options;
  options.use_stringer = true;
  const Bundle bundle{Version{3, 4}};
  EXPECT_EQ(canonical_bytes(bundle, &options), std::string("Bundle") + "Version" + "3.4");
  EXPECT_EQ(canonical_bytes(bundle),
            std::string("Bundle") + "Version" + "Version" + "Major" + le64(3) + "Minor" + le64(4));

  const Release release{"core", Version{1, 2}};
  EXPECT_EQ(canonical_bytes(release, &options), canonical_bytes(release));
  EXPECT_TRUE(sh::hash::hash(Wrapper{}, sh::hash::Format::Md5, &options).has_value());
}

TEST(Hash, TagNameSelectsMetadataKey) {
  const MultiTag a{1, 10};
  const MultiTag b{2, 20};
  EXPECT_EQ(canonical_bytes(a), std::string("MultiTag") + "A" + le64(1));
  EXPECT_NE(md5(a), md5(b));

  sh::hash::HashOptions custom;
  custom.tag_name = "custom";
  EXPECT_EQ(canonical_bytes(a, &custom), std::string("MultiTag") + "B" + le64(10));

  sh::hash::HashOptions empty;
  empty.tag_name.clear();
  EXPECT_EQ(canonical_bytes(a, &empty), canonical_bytes(a));
}

TEST(Hash, ZeroNilMakesAbsentEqualZeroTarget) {
  fixtures::StructB zero;
  const Optionally absent{"n", nullptr};
  const Optionally pointing{"n", &zero};

  sh::hash::HashOptions options;
  options.zero_nil = true;
  EXPECT_EQ(md5(absent, &options), md5(pointing, &options));
  EXPECT_NE(md5(absent), md5(pointing));
}

TEST(Hash, ZeroNilOnGoldenPointer) {
  sh::hash::HashOptions options;
  options.zero_nil = true;
  auto with_nil = fixtures::golden_a();
  with_nil.a_ptr.reset();
  auto with_zero = fixtures::golden_a();
  with_zero.a_ptr = std::make_shared<fixtures::StructB>();
  EXPECT_EQ(md5(with_nil, &options), md5(with_zero, &options));
}

TEST(Hash, ZeroNilTerminatesOnSelfReferentialRecord) {
  sh::hash::HashOptions options;
  options.zero_nil = true;

  Node leaf;
  leaf.value = 1;
  // The zero Node substituted for the missing tail has its own missing tail,
  // which falls back to the signed-integer zero.
  EXPECT_EQ(canonical_bytes(leaf, &options),
            std::string("Node") + "Value" + le64(1) + "Next" + "Node" + "Value" + le64(0) + "Next" + le64(0));

  Node list;
  list.value = 1;
  list.next = std::make_unique<Node>();
  list.next->value = 2;
  list.next->next = std::make_unique<Node>();
  list.next->next->value = 3;
  auto digest = sh::hash::hash(list, sh::hash::Format::Md5, &options);
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(*digest, md5(list, &options));
  EXPECT_NE(*digest, md5(list));
}

TEST(Hash, SelfReferentialRecordWithoutZeroNil) {
  Node leaf;
  leaf.value = 1;
  EXPECT_EQ(canonical_bytes(leaf), std::string("Node") + "Value" + le64(1) + "Next" + le64(0));
}

TEST(Hash, NilDiffersFromPresentValue) {
  fixtures::StructB value{1, true};
  EXPECT_NE(md5(Optionally{"n", nullptr}), md5(Optionally{"n", &value}));
}

TEST(Hash, OptionsDoNotChangeDefaultsWhenNull) {
  const sh::hash::HashOptions defaults;
  EXPECT_EQ(md5(fixtures::golden_a(), &defaults), md5(fixtures::golden_a()));
}

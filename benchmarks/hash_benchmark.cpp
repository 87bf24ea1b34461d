#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "hash/hash.hpp"

namespace {

struct Point {
  std::int64_t x = 0;
  std::int64_t y = 0;
  std::string label;
};

struct Scene {
  std::string name;
  std::vector<Point> points;
  std::unordered_map<std::string, Point> anchors;
  std::vector<std::int64_t> ids;
};

auto make_scene(std::int64_t size) -> Scene {
  Scene scene;
  scene.name = "bench";
  for (std::int64_t i = 0; i < size; ++i) {
    scene.points.push_back(Point{i, -i, "p" + std::to_string(i)});
    scene.anchors.emplace("a" + std::to_string(i), Point{i, i, "anchor"});
    scene.ids.push_back(i * 7);
  }
  return scene;
}

}  // namespace

namespace sh::hash {

template <>
struct record_traits<Point> {
  static constexpr auto describe() {
    return record<Point>("Point").field("X", &Point::x).field("Y", &Point::y).field("Label", &Point::label);
  }
};

template <>
struct record_traits<Scene> {
  static constexpr auto describe() {
    return record<Scene>("Scene")
        .field("Name", &Scene::name)
        .field("Points", &Scene::points)
        .field("Anchors", &Scene::anchors)
        .field("Ids", &Scene::ids, as_set);
  }
};

}  // namespace sh::hash

static void BM_HashScene(benchmark::State& state, sh::hash::Format format) {
  const auto scene = make_scene(state.range(0));
  for (auto _ : state) {
    auto digest = sh::hash::hash(scene, format);
    if (!digest) {
      state.SkipWithError(digest.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(digest->data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_CAPTURE(BM_HashScene, md5, sh::hash::Format::Md5)->RangeMultiplier(8)->Range(8, 4096);
BENCHMARK_CAPTURE(BM_HashScene, blake3, sh::hash::Format::Blake3)->RangeMultiplier(8)->Range(8, 4096);
BENCHMARK_CAPTURE(BM_HashScene, xxh3, sh::hash::Format::Xxh3)->RangeMultiplier(8)->Range(8, 4096);

static void BM_HashFlatVector(benchmark::State& state) {
  std::vector<std::int64_t> values(static_cast<std::size_t>(state.range(0)));
  for (std::size_t i = 0; i < values.size(); ++i) {
    values[i] = static_cast<std::int64_t>(i);
  }
  for (auto _ : state) {
    auto digest = sh::hash::hash(values, sh::hash::Format::Xxh3);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0) * 8);
}

BENCHMARK(BM_HashFlatVector)->Range(64, 1 << 16);

BENCHMARK_MAIN();

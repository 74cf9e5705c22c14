#include <benchmark/benchmark.h>

#include <string>

#include "core/friendly_id.hpp"
#include "core/typed_id.hpp"
#include "kinds/user_type.hpp"

namespace {

using demo::UserType;

void BM_Generate(benchmark::State& state) {
  for (auto _ : state) {
    auto id = tuid::core::TypedId<UserType>::generate(UserType::Business);
    benchmark::DoNotOptimize(id);
  }
}
// Threads share nothing but the per-thread random device.
BENCHMARK(BM_Generate)->Threads(1)->Threads(4)->Threads(8);

void BM_Format(benchmark::State& state) {
  auto friendly = tuid::core::FriendlyId<UserType>::generate(UserType::Organization);
  for (auto _ : state) {
    auto text = friendly.to_string();
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Format);

void BM_Parse(benchmark::State& state) {
  const std::string text =
      tuid::core::FriendlyId<UserType>::generate(UserType::Retail).to_string();
  for (auto _ : state) {
    auto parsed = tuid::core::FriendlyId<UserType>::parse(text);
    benchmark::DoNotOptimize(parsed);
  }
}
BENCHMARK(BM_Parse);

}  // namespace

BENCHMARK_MAIN();

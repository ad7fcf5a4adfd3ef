#include <benchmark/benchmark.h>
#include <cmath>
#include <cstdint>
#include <vector>

#include "core/motion_classifier.hpp"

#include <wiggle/detector.hpp>

using namespace wiggle;

// --- Helpers ---

static std::vector<Sample> make_shake(std::size_t n)
{
    std::vector<Sample> s(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        float x = (i % 2 == 0) ? 0.0f : 25.0f;
        float y = std::sin(static_cast<float>(i) * 0.3f) * 4.0f;
        s[i] = Sample{{x, y}, static_cast<double>(i) * 0.016};
    }
    return s;
}

// --- Classifier ---

static void BM_Classify(benchmark::State& state)
{
    const auto n = static_cast<std::size_t>(state.range(0));
    auto samples = make_shake(n);
    Thresholds t;
    for (auto _ : state)
    {
        auto stats = classify(samples, t);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Classify)->Arg(8)->Arg(32)->Arg(128)->Arg(1024);

// --- Detector tick path ---

static void BM_DetectorTick_Drag(benchmark::State& state)
{
    WiggleDetector d;
    d.start_tracking(1);
    double t = 0.0;
    float x = 0.0f;
    for (auto _ : state)
    {
        t += 0.016;
        x += 3.0f;
        benchmark::DoNotOptimize(d.on_tick(1, x, 0.0f, t));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DetectorTick_Drag);

static void BM_DetectorTick_MultiEntity(benchmark::State& state)
{
    const auto entities = static_cast<EntityId>(state.range(0));
    WiggleDetector d(Thresholds{}, DetectorOptions{.multi_entity = true});
    for (EntityId id = 0; id < entities; ++id)
        d.start_tracking(id);

    double t = 0.0;
    std::size_t frame = 0;
    for (auto _ : state)
    {
        t += 0.016;
        ++frame;
        float x = (frame % 2 == 0) ? 0.0f : 25.0f;
        for (EntityId id = 0; id < entities; ++id)
            benchmark::DoNotOptimize(d.on_tick(id, x, static_cast<float>(id), t));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(entities));
}
BENCHMARK(BM_DetectorTick_MultiEntity)->Arg(1)->Arg(16)->Arg(256);

BENCHMARK_MAIN();

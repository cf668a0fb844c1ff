/**
 * @file propsync_benchmark.cpp
 * @brief PropSync copy throughput benchmark
 *
 * Benchmark categories:
 * 1. Plan Lookup - Baseline and exclusion plans
 * 2. Copy All - Per-call shape walk vs cached plan vs handwritten assignment
 * 3. Copy Excluding - Names vs selectors
 * 4. Merge Collections - In-place list merge by list size
 * 5. JSON - Serialize, parse and clone
 */

#include <benchmark/benchmark.h>
#include "PropSync/PropSync.hpp"
#include "benchmark_common.hpp"

#include <string>
#include <vector>

using namespace propsync;

// ============================================================================
// Type Registration
// ============================================================================

PROPSYNC_REGISTRATION
{
    Registry<Vector3>()
        .property("X", &Vector3::x)
        .property("Y", &Vector3::y)
        .property("Z", &Vector3::z);

    Registry<SimpleClass>()
        .property("IntValue", &SimpleClass::intValue)
        .property("FloatValue", &SimpleClass::floatValue)
        .property("StringValue", &SimpleClass::stringValue);

    Registry<ComplexClass>()
        .property("Id", &ComplexClass::id)
        .property("Name", &ComplexClass::getName, &ComplexClass::setName)
        .property("Position", &ComplexClass::position)
        .property("Scores", &ComplexClass::scores)
        .property("Tags", &ComplexClass::tags);

    Registry<DeepClass>()
        .property("Level1", &DeepClass::level1)
        .property("Level2", &DeepClass::level2)
        .property("Level3", &DeepClass::level3)
        .property("Level4", &DeepClass::level4)
        .property("Level5", &DeepClass::level5)
        .property("Data", &DeepClass::data);
}

// ============================================================================
// 1. Plan Lookup Benchmarks
// ============================================================================

static void PropSync_PlanLookup_Baseline(benchmark::State& state) {
    auto& cache = PlanCache::instance();
    const auto& type = detail::type_info_of<DeepClass>();
    for (auto _ : state) {
        auto plan = cache.get_plan(type, PlanKind::Replace);
        benchmark::DoNotOptimize(plan);
    }
}
BENCHMARK(PropSync_PlanLookup_Baseline);

static void PropSync_PlanLookup_Excluding(benchmark::State& state) {
    auto& cache = PlanCache::instance();
    const auto& type = detail::type_info_of<DeepClass>();
    const ExclusionSet excluded{"Level2", "Data"};
    for (auto _ : state) {
        auto plan = cache.get_plan(type, PlanKind::Replace, excluded);
        benchmark::DoNotOptimize(plan);
    }
}
BENCHMARK(PropSync_PlanLookup_Excluding);

// Building the exclusion key is part of every name-based copy
static void PropSync_ExclusionKey(benchmark::State& state) {
    for (auto _ : state) {
        ExclusionSet excluded{"Level2", "Data", "Level4"};
        benchmark::DoNotOptimize(excluded.key());
    }
}
BENCHMARK(PropSync_ExclusionKey);

// ============================================================================
// 2. Copy All Benchmarks
// ============================================================================

// Baseline: handwritten member assignment
static void Native_CopyAll_Simple(benchmark::State& state) {
    SimpleClass target;
    const SimpleClass source{42, 3.14f, "hello"};
    for (auto _ : state) {
        target.intValue = source.intValue;
        target.floatValue = source.floatValue;
        target.stringValue = source.stringValue;
        benchmark::DoNotOptimize(target);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(Native_CopyAll_Simple);

static void PropSync_CopyAll_Simple(benchmark::State& state) {
    SimpleClass target;
    const SimpleClass source{42, 3.14f, "hello"};
    for (auto _ : state) {
        copy_all(target, source);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyAll_Simple);

static void PropSync_CopyAllFast_Simple(benchmark::State& state) {
    SimpleClass target;
    const SimpleClass source{42, 3.14f, "hello"};
    for (auto _ : state) {
        copy_all_fast(target, source);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyAllFast_Simple);

static void Native_CopyAll_Deep(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    for (auto _ : state) {
        target.level1 = source.level1;
        target.level2 = source.level2;
        target.level3 = source.level3;
        target.level4 = source.level4;
        target.level5 = source.level5;
        target.data = source.data;
        benchmark::DoNotOptimize(target);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(Native_CopyAll_Deep);

static void PropSync_CopyAll_Deep(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    for (auto _ : state) {
        copy_all(target, source);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyAll_Deep);

static void PropSync_CopyAllFast_Deep(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    for (auto _ : state) {
        copy_all_fast(target, source);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyAllFast_Deep);

static void PropSync_CopyAllFast_Complex(benchmark::State& state) {
    ComplexClass target;
    const ComplexClass source = make_complex(1, 8);
    for (auto _ : state) {
        copy_all_fast(target, source);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyAllFast_Complex);

// ============================================================================
// 3. Copy Excluding Benchmarks
// ============================================================================

static void PropSync_CopyExcluding_Names(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    for (auto _ : state) {
        copy_excluding(target, source, {"Level2", "Data"});
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyExcluding_Names);

// Pre-built set: no key construction inside the loop
static void PropSync_CopyExcluding_PrebuiltSet(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    const ExclusionSet excluded{"Level2", "Data"};
    for (auto _ : state) {
        copy_excluding(target, source, excluded);
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyExcluding_PrebuiltSet);

static void PropSync_CopyExcluding_Selectors(benchmark::State& state) {
    DeepClass target;
    const DeepClass source{1, 2, 3, 4, 5, "payload"};
    for (auto _ : state) {
        copy_excluding(target, source, {&DeepClass::level2, &DeepClass::data});
        benchmark::DoNotOptimize(target);
    }
}
BENCHMARK(PropSync_CopyExcluding_Selectors);

// ============================================================================
// 4. Merge Collections Benchmarks
// ============================================================================

static void PropSync_CopyAllFast_ReplaceList(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    ComplexClass target = make_complex(0, count);
    const ComplexClass source = make_complex(1, count);
    for (auto _ : state) {
        copy_all_fast(target, source);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(PropSync_CopyAllFast_ReplaceList)->Range(8, 1024);

static void PropSync_MergeCollections(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    ComplexClass target = make_complex(0, count);
    const ComplexClass source = make_complex(1, count);
    for (auto _ : state) {
        copy_merging_collections(target, source);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(PropSync_MergeCollections)->Range(8, 1024);

static void PropSync_MergeCollections_Subscribed(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    ComplexClass target = make_complex(0, count);
    const ComplexClass source = make_complex(1, count);

    std::size_t notifications = 0;
    target.tags->subscribe([&](const CollectionChange&) { ++notifications; });

    for (auto _ : state) {
        copy_merging_collections(target, source);
        benchmark::DoNotOptimize(notifications);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(PropSync_MergeCollections_Subscribed)->Range(8, 1024);

// ============================================================================
// 5. JSON Benchmarks
// ============================================================================

static void PropSync_ToJson_Complex(benchmark::State& state) {
    const ComplexClass source = make_complex(1, 8);
    const JsonOptions compact{JsonNaming::CamelCase, -1};
    for (auto _ : state) {
        auto text = to_json(source, compact);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(PropSync_ToJson_Complex);

static void PropSync_FromJson_Complex(benchmark::State& state) {
    const std::string text = to_json(make_complex(1, 8));
    for (auto _ : state) {
        auto obj = from_json<ComplexClass>(text);
        benchmark::DoNotOptimize(obj);
    }
}
BENCHMARK(PropSync_FromJson_Complex);

static void PropSync_JsonClone_Complex(benchmark::State& state) {
    const ComplexClass source = make_complex(1, 8);
    for (auto _ : state) {
        auto copy = json_clone(source);
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(PropSync_JsonClone_Complex);

static void PropSync_JsonFragment(benchmark::State& state) {
    const std::string text = to_json(make_complex(1, 8));
    for (auto _ : state) {
        auto fragment = get_json_fragment(text, "tags[3]");
        benchmark::DoNotOptimize(fragment);
    }
}
BENCHMARK(PropSync_JsonFragment);

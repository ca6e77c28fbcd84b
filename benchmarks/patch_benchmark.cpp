// entitypatch-cpp benchmarks: throughput of pointer parsing, request
// validation and patch application.

#include <entitypatch-cpp/entitypatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace entitypatch_cpp;
using json = nlohmann::json;

// Payload with `n` keys under /data/fields and an `n`-element list under /data/items.
static auto make_doc(std::size_t n) -> Document {
    auto fields = json::object();
    auto items = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        fields["field" + std::to_string(i)] = json{{"value", i}, {"tags", {"a", "b"}}};
        items.push_back(i);
    }
    return Document{"bench", json{{"fields", std::move(fields)}, {"items", std::move(items)}}};
}

// =============================================================================
// Pointers
// =============================================================================

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto ptr = JsonPointer::parse("/data/fields/field42/tags/0");
        benchmark::DoNotOptimize(ptr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse);

static void bm_pointer_parse_escaped(benchmark::State& state) {
    for (auto _ : state) {
        auto ptr = JsonPointer::parse("/data/a~1b/c~0d/e~1f~0g/~01");
        benchmark::DoNotOptimize(ptr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse_escaped);

// =============================================================================
// Request validation
// =============================================================================

static void bm_parse_patch_request(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto records = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        records.push_back({{"op", "replace"},
                           {"path", "/data/fields/field" + std::to_string(i) + "/value"},
                           {"value", i * 2}});
    }
    for (auto _ : state) {
        auto request = parse_patch_request(records);
        benchmark::DoNotOptimize(request);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_parse_patch_request)->Range(1, 256);

// =============================================================================
// Application
// =============================================================================

static void bm_apply_replace_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_doc(n);
    auto operations = std::vector<Operation>{};
    for (std::size_t i = 0; i < n; ++i) {
        operations.push_back(
            ops::replace("/data/fields/field" + std::to_string(i) + "/value", i * 2));
    }
    const auto request = PatchRequest(std::move(operations));

    for (auto _ : state) {
        auto outcome = apply_patch(doc, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_replace_batch)->Range(1, 256);

static void bm_apply_array_append(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto request = PatchRequest{ops::add("/data/items/-", 1)};
    for (auto _ : state) {
        auto outcome = apply_patch(doc, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_array_append)->Range(8, 4096);

static void bm_apply_move(benchmark::State& state) {
    const auto doc = make_doc(64);
    const auto request = PatchRequest{
        ops::move("/data/fields/field0", "/data/archive/field0"),
        ops::copy("/data/fields/field1", "/data/items/0"),
    };
    for (auto _ : state) {
        auto outcome = apply_patch(doc, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_move);

// Aborting at the last operation still pays for the working copy.
static void bm_apply_failed_test(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto request = PatchRequest{
        ops::add("/data/items/-", 1),
        ops::test("/name", "not the label"),
    };
    for (auto _ : state) {
        auto outcome = apply_patch(doc, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_failed_test)->Range(8, 4096);

static void bm_apply_json_patch(benchmark::State& state) {
    const auto doc = make_doc(16);
    const auto patch = json::parse(R"([
        {"op": "test", "path": "/name", "value": "bench"},
        {"op": "replace", "path": "/name", "value": "renamed"},
        {"op": "add", "path": "/data/fields/field3/tags/-", "value": "c"},
        {"op": "remove", "path": "/data/items/0"}
    ])");
    for (auto _ : state) {
        auto outcome = apply_json_patch(doc, patch);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_json_patch);

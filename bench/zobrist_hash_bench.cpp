#include <zobrist/fx_hasher.hpp>
#include <zobrist/zobrist_hash.hpp>

#include <benchmark/benchmark.h>
#include <cstddef>
#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace zobrist;

using Cell = std::tuple<std::size_t, std::size_t, uint8_t>;

// ---------- Helpers ----------

static std::vector<Cell> make_cells(std::size_t count, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::size_t> coord(0, 63);
    std::uniform_int_distribution<unsigned> piece(0, 11);
    std::vector<Cell> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        out.emplace_back(coord(rng), coord(rng),
                         static_cast<uint8_t>(piece(rng)));
    return out;
}

// ---------- fx_hash ----------

static void BM_FxHash_U64(benchmark::State &state) {
    uint64_t v = 0x9E3779B97F4A7C15ULL;
    for (auto _ : state) {
        auto h = fx_hash(v);
        benchmark::DoNotOptimize(h);
        ++v;
    }
}

static void BM_FxHash_Cell(benchmark::State &state) {
    Cell c{3, 4, 7};
    for (auto _ : state) {
        auto h = fx_hash(c);
        benchmark::DoNotOptimize(h);
    }
}

static void BM_FxHash_String(benchmark::State &state) {
    std::string s(static_cast<std::size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        auto h = fx_hash(s);
        benchmark::DoNotOptimize(h);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}

// ---------- Incremental update ----------

// One piece move: remove from the old cell, add at the new one.
static void BM_Incremental_Move(benchmark::State &state) {
    ZobristHash<Cell> z;
    Cell from{1, 4, 0};
    Cell to{3, 4, 0};
    z.add(from);
    for (auto _ : state) {
        z.remove(from);
        z.add(to);
        benchmark::DoNotOptimize(z);
        std::swap(from, to);
    }
}

// ---------- Full recompute ----------

// Rehash the whole set after a change, as a non-incremental fingerprint
// would have to.
static void BM_FullRecompute(benchmark::State &state) {
    auto cells = make_cells(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        uint64_t h = 0;
        for (const auto &c : cells)
            h ^= fx_hash(c);
        benchmark::DoNotOptimize(h);
    }
}

// ---------- Build from scratch ----------

static void BM_Build(benchmark::State &state) {
    auto cells = make_cells(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        uint64_t h = 0;
        for (const auto &c : cells)
            h ^= fx_hash(c);
        auto z = ZobristHash<Cell>::from_raw(h);
        benchmark::DoNotOptimize(z);
    }
}

BENCHMARK(BM_FxHash_U64);
BENCHMARK(BM_FxHash_Cell);
BENCHMARK(BM_FxHash_String)->Arg(1)->Arg(7)->Arg(8)->Arg(15)->Arg(64)->Arg(256);
BENCHMARK(BM_Incremental_Move);
BENCHMARK(BM_FullRecompute)->Arg(16)->Arg(32)->Arg(64)->Arg(256)->Arg(1024);
BENCHMARK(BM_Build)->Arg(32)->Arg(1024);

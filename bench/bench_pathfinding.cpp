#include <benchmark/benchmark.h>
#include "maze/io/MazeText.hpp"
#include "maze/pathfinding/Search.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

using namespace maze::pf;

// Random walls with the corners forced open; start top-left, goal bottom-right.
static Grid make_random(int w, int h, double blocked, uint32_t seed = 1337) {
    std::vector<std::uint8_t> walls(static_cast<size_t>(w) * static_cast<size_t>(h));
    std::mt19937 rng(seed);
    std::bernoulli_distribution wall_prob(blocked);
    for (auto& c : walls) c = wall_prob(rng) ? 1 : 0;
    walls.front() = 0;
    walls.back() = 0;
    return Grid(h, w, std::move(walls), {0, 0}, {h - 1, w - 1});
}

// Boustrophedon corridor: one path, no branching.
static Grid make_serpentine(int w, int h) {
    std::string text;
    for (int y = 0; y < h; ++y) {
        std::string row(static_cast<size_t>(w), ' ');
        if (y % 2 == 1) {
            row.assign(static_cast<size_t>(w), '#');
            row[(y / 2) % 2 == 0 ? static_cast<size_t>(w - 1) : 0u] = ' ';
        }
        if (y == 0) row[0] = 'A';
        if (y == h - 1) row[((h - 2) / 2) % 2 == 0 ? 0u : static_cast<size_t>(w - 1)] = 'B';
        text += row;
        text += '\n';
    }
    return maze::io::parse_maze(text);
}

template <Strategy S>
static void bench_random(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const Grid g = make_random(w, w, 0.20);
    std::size_t explored = 0;
    for (auto _ : st) {
        auto r = solve(g, S);
        explored = r.explored_count;
        benchmark::DoNotOptimize(r.status);
    }
    st.counters["explored"] = static_cast<double>(explored);
}
BENCHMARK_TEMPLATE(bench_random, Strategy::Uninformed)->Arg(128)->Arg(256)->Arg(512);
BENCHMARK_TEMPLATE(bench_random, Strategy::Heuristic)->Arg(128)->Arg(256)->Arg(512);

template <Strategy S>
static void bench_serpentine(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const Grid g = make_serpentine(w, w | 1);
    for (auto _ : st) {
        auto r = solve(g, S);
        benchmark::DoNotOptimize(r.explored_count);
    }
}
BENCHMARK_TEMPLATE(bench_serpentine, Strategy::Uninformed)->Arg(64)->Arg(256);
BENCHMARK_TEMPLATE(bench_serpentine, Strategy::Heuristic)->Arg(64)->Arg(256);

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::warn); // solve() logs at debug
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}

// SEQL Benchmarks
// Each workload is measured three ways:
// 1. Handwritten loop
// 2. std::ranges views
// 3. SEQL cursors

#include <benchmark/benchmark.h>
#include <seql/seql.h>
#include <vector>
#include <ranges>
#include <numeric>
#include <tuple>

namespace {

constexpr auto not_divisible_by_2 = [](long long i) { return i % 2 != 0; };
constexpr auto not_divisible_by_3 = [](long long i) { return i % 3 != 0; };
constexpr auto not_divisible_by_5 = [](long long i) { return i % 5 != 0; };
constexpr auto not_divisible_by_7 = [](long long i) { return i % 7 != 0; };
constexpr auto not_divisible_by_11 = [](long long i) { return i % 11 != 0; };

constexpr auto times_13 = [](long long i) { return i * 13; };
constexpr auto plus_17 = [](long long i) { return i + 17; };
constexpr auto times_19 = [](long long i) { return i * 19; };
constexpr auto minus_23 = [](long long i) { return i - 23; };

template<typename Cursor>
long long sum(Cursor &&c) {
    long long result = 0;
    for (long long x : c) result += x;
    return result;
}

// ============================================================================
// Filter Chain Benchmarks
// ============================================================================

static void BM_HandwrittenFilter(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        long long result = 0;
        for (long long i = 0; i < end; ++i) {
            if (i % 2 != 0 && i % 3 != 0 && i % 5 != 0
                && i % 7 != 0 && i % 11 != 0) {
                result += i;
            }
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandwrittenFilter)->Range(1000, 1000000);

static void BM_StdRangesFilter(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        using std::ranges::views::filter;
        long long result = std::ranges::fold_left(std::ranges::iota_view(0LL, end)
            | filter(not_divisible_by_2)
            | filter(not_divisible_by_3)
            | filter(not_divisible_by_5)
            | filter(not_divisible_by_7)
            | filter(not_divisible_by_11), 0LL, std::plus<>{});
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_StdRangesFilter)->Range(1000, 1000000);

static void BM_SeqlFilter(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        auto numbers = seql::take(seql::count(0LL), end);
        long long result = sum(
            seql::filter(
                seql::filter(
                    seql::filter(
                        seql::filter(
                            seql::filter(std::move(numbers), not_divisible_by_2),
                            not_divisible_by_3),
                        not_divisible_by_5),
                    not_divisible_by_7),
                not_divisible_by_11));
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SeqlFilter)->Range(1000, 1000000);

// ============================================================================
// Mixed Map + Filter Benchmarks
// ============================================================================

static void BM_HandwrittenMixed(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        long long result = 0;
        for (long long i = 0; i < end; ++i) {
            long long x = i * 13;
            if (x % 3 != 0) {
                x = x + 17;
                if (x % 5 != 0) {
                    x = x * 19;
                    if (x % 7 != 0) {
                        result += x - 23;
                    }
                }
            }
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandwrittenMixed)->Range(1000, 1000000);

static void BM_StdRangesMixed(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        using std::ranges::views::transform;
        using std::ranges::views::filter;
        long long result = std::ranges::fold_left(std::ranges::iota_view(0LL, end)
            | transform(times_13)
            | filter(not_divisible_by_3)
            | transform(plus_17)
            | filter(not_divisible_by_5)
            | transform(times_19)
            | filter(not_divisible_by_7)
            | transform(minus_23), 0LL, std::plus<>{});
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_StdRangesMixed)->Range(1000, 1000000);

static void BM_SeqlMixed(benchmark::State& state) {
    auto end = state.range(0);
    for (auto _ : state) {
        auto a = seql::filter(seql::map(seql::take(seql::count(0LL), end), times_13),
                              not_divisible_by_3);
        auto b = seql::filter(seql::map(std::move(a), plus_17), not_divisible_by_5);
        auto c = seql::filter(seql::map(std::move(b), times_19), not_divisible_by_7);
        long long result = sum(seql::map(std::move(c), minus_23));
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SeqlMixed)->Range(1000, 1000000);

// ============================================================================
// Pairwise Benchmarks (zip of a sequence with itself shifted by one)
// ============================================================================

std::vector<long long> make_input(long long n) {
    std::vector<long long> v(static_cast<std::size_t>(n));
    std::iota(v.begin(), v.end(), 0LL);
    return v;
}

static void BM_HandwrittenPairwise(benchmark::State& state) {
    auto v = make_input(state.range(0));
    for (auto _ : state) {
        long long result = 0;
        for (std::size_t i = 1; i < v.size(); ++i) {
            result += v[i] - v[i - 1];
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HandwrittenPairwise)->Range(1000, 1000000);

static void BM_StdRangesPairwise(benchmark::State& state) {
    auto v = make_input(state.range(0));
    for (auto _ : state) {
        long long result = 0;
        for (auto [a, b] : std::views::zip(v, v | std::views::drop(1))) {
            result += b - a;
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_StdRangesPairwise)->Range(1000, 1000000);

static void BM_SeqlPairwise(benchmark::State& state) {
    auto v = make_input(state.range(0));
    for (auto _ : state) {
        long long result = 0;
        for (auto &[a, b] : seql::zip(v, seql::drop(v, 1))) {
            result += b - a;
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SeqlPairwise)->Range(1000, 1000000);

static void BM_SeqlWindowPairwise(benchmark::State& state) {
    auto v = make_input(state.range(0));
    for (auto _ : state) {
        long long result = 0;
        for (auto &w : seql::window(v, 2)) {
            result += w[1] - w[0];
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SeqlWindowPairwise)->Range(1000, 1000000);

}  // namespace


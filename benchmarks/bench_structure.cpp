/**
 * SPNLearn Structure Benchmarks
 */

#include <benchmark/benchmark.h>
#include "spnlearn/spnlearn.hpp"
#include <vector>
#include <random>

using namespace spnlearn;

namespace {

// Mixture of two correlated clusters over n_features columns
Dataset make_dataset(Index n_samples, Index n_features) {
    Matrix m(n_samples, n_features);
    std::mt19937 rng(123);
    std::normal_distribution<Float> dist(0.0f, 1.0f);

    for (Index i = 0; i < n_samples; ++i) {
        const Float center = (i % 2 == 0) ? -3.0f : 3.0f;
        const Float shared = dist(rng);
        for (Index j = 0; j < n_features; ++j) {
            m(i, j) = center + (j % 2 == 0 ? shared : dist(rng));
        }
    }
    return Dataset(m);
}

} // namespace

// Benchmark end-to-end structure learning
static void BM_LearnParametric(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset data = make_dataset(n_samples, 10);

    Config config;
    config.structure.min_instances_slice = 100;
    config.verbosity = 0;
    Context context(std::vector<MetaType>(10, MetaType::Real));

    for (auto _ : state) {
        auto spn = learn_parametric(data, context, config);
        benchmark::DoNotOptimize(spn);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_LearnParametric)->Range(1000, 20000)->Unit(benchmark::kMillisecond);

// Benchmark a single policy decision (dominated by the zero-variance scan)
static void BM_SelectOperation(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset data = make_dataset(n_samples, 20);
    DataSlice slice(data);
    Scope scope(20);
    for (Index j = 0; j < 20; ++j) scope[j] = j;

    OperationPolicy policy;

    for (auto _ : state) {
        OperationChoice choice = policy(slice, scope, false, false, false);
        benchmark::DoNotOptimize(choice);
    }
}
BENCHMARK(BM_SelectOperation)->Range(100, 100000);

// Benchmark batch log-likelihood of a learned network
static void BM_LogLikelihoodBatch(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset data = make_dataset(n_samples, 10);

    Config config;
    config.verbosity = 0;
    auto spn = learn_parametric(data, Context(std::vector<MetaType>(10, MetaType::Real)), config);

    for (auto _ : state) {
        std::vector<Double> ll = log_likelihood(*spn, data);
        benchmark::DoNotOptimize(ll);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_LogLikelihoodBatch)->Range(1000, 100000);

BENCHMARK_MAIN();

#include <benchmark/benchmark.h>

#include <Eigen/Dense>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <vector>

#include <swne/ops/embed.hpp>
#include <swne/ops/factorization/nmf.hpp>
#include <swne/ops/graph/pca.hpp>
#include <swne/ops/graph/snn.hpp>
#include <swne/ops/project.hpp>

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() {
    setenv("SWNE_QUIET", "all", 1);
  }
} kBenchEnvSetup;

swne::data::FactorScores make_scores(int k, int n, uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> noise(0.0f, 0.05f);
  std::uniform_real_distribution<float> peak(0.6f, 1.0f);

  Eigen::MatrixXf values(k, n);
  for (int j = 0; j < n; ++j) {
    for (int f = 0; f < k; ++f) {
      values(f, j) = f == j % k ? peak(gen) : noise(gen);
    }
  }
  return swne::data::FactorScores(values);
}

Eigen::MatrixXf make_counts(int features, int samples, int k, uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> unit(0.0f, 1.0f);
  const Eigen::MatrixXf W = Eigen::MatrixXf::NullaryExpr(features, k, [&]() { return unit(gen); });
  const Eigen::MatrixXf H = Eigen::MatrixXf::NullaryExpr(k, samples, [&]() { return unit(gen); });
  return W * H;
}

void bench_anchor_layout(benchmark::State& state) {
  const auto scores = make_scores(static_cast<int>(state.range(0)), 5000, 3);
  for (auto _ : state) {
    auto anchors = swne::ops::compute_anchor_layout(scores, swne::data::DistanceMode::InformationContent,
                                                    swne::data::ProjectionMethod::Sammon, 42);
    benchmark::DoNotOptimize(anchors.coords.data());
  }
}

void bench_snn_graph(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const Eigen::MatrixXf embedding = make_scores(20, n, 5).values;
  swne::ops::graph::SnnOptions options;
  for (auto _ : state) {
    auto graph = swne::ops::graph::build_snn_graph(embedding, options);
    benchmark::DoNotOptimize(graph.num_edges());
  }
  state.SetItemsProcessed(state.iterations() * n);
}

void bench_embed_swne(benchmark::State& state) {
  const int n = static_cast<int>(state.range(0));
  const auto scores = make_scores(16, n, 7);
  swne::ops::graph::SnnOptions options;
  const auto graph = swne::ops::graph::build_snn_graph(scores.values, options);
  for (auto _ : state) {
    auto embedding = swne::ops::embed_swne(scores, graph, swne::data::EmbeddingParams{});
    benchmark::DoNotOptimize(embedding.samples.coords.data());
  }
  state.SetItemsProcessed(state.iterations() * n);
}

void bench_project_samples(benchmark::State& state) {
  const int n_query = static_cast<int>(state.range(0));
  const auto train = make_scores(16, 4000, 7);
  const auto query = make_scores(16, n_query, 8);
  swne::ops::graph::SnnOptions options;
  const auto graph = swne::ops::graph::build_snn_graph(train.values, options);
  const auto embedding = swne::ops::embed_swne(train, graph, swne::data::EmbeddingParams{});
  const auto bridge = swne::ops::graph::build_projection_graph(train.values, query.values, options);
  for (auto _ : state) {
    auto projection = swne::ops::project_samples(embedding, query, bridge, swne::data::ProjectParams{});
    benchmark::DoNotOptimize(projection.samples.coords.data());
  }
  state.SetItemsProcessed(state.iterations() * n_query);
}

void bench_nmf(benchmark::State& state) {
  const Eigen::MatrixXf counts = make_counts(500, static_cast<int>(state.range(0)), 10, 11);
  swne::ops::factorization::NmfOptions options;
  options.max_iterations = 100;
  for (auto _ : state) {
    auto result = swne::ops::factorization::run_nmf(counts, options);
    benchmark::DoNotOptimize(result.H.data());
  }
}

void bench_pca(benchmark::State& state) {
  const Eigen::MatrixXf counts = make_counts(2000, static_cast<int>(state.range(0)), 10, 13);
  for (auto _ : state) {
    auto model = swne::ops::graph::compute_pca(counts, 20);
    benchmark::DoNotOptimize(model.embeddings.data());
  }
}
} // namespace

BENCHMARK(bench_anchor_layout)->Arg(8)->Arg(32);
BENCHMARK(bench_snn_graph)->Arg(2000)->Arg(10000);
BENCHMARK(bench_embed_swne)->Arg(2000)->Arg(10000);
BENCHMARK(bench_project_samples)->Arg(500);
BENCHMARK(bench_nmf)->Arg(1000);
BENCHMARK(bench_pca)->Arg(1000);

BENCHMARK_MAIN();

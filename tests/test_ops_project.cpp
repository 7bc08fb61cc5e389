#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>
#include <swne/ops/project.hpp>

#include "support/synthetic_data.hpp"
#include "support/test_env.hpp"
#include "support/tolerances.hpp"

namespace {

// Samples 0..n-2 form a chain; the last sample has no neighbours.
swne::data::Embedding make_training_embedding(const swne::data::FactorScores &scores) {
  const int n = scores.num_samples();
  std::vector<swne::data::GraphEdge> edges;
  for (int i = 0; i + 2 < n; ++i) {
    edges.push_back({i, i + 1, 1.0f});
    edges.push_back({i + 1, i, 1.0f});
  }
  const auto graph = swne::data::SimilarityGraph::sample_graph(n, std::move(edges));
  return swne::ops::embed_swne(scores, graph, swne::data::EmbeddingParams{});
}

swne::data::FactorScores pick_columns(const swne::data::FactorScores &scores,
                                      const std::vector<int> &cols,
                                      const std::vector<std::string> &ids) {
  Eigen::MatrixXf values(scores.num_factors(), static_cast<int>(cols.size()));
  for (size_t c = 0; c < cols.size(); ++c) {
    values.col(static_cast<int>(c)) = scores.values.col(cols[c]);
  }
  return swne::data::FactorScores(values, scores.factor_ids.ids(), ids);
}

} // namespace

TEST_CASE("projecting a copy of a training sample reproduces its position") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(4, 6);
  const auto embedding = make_training_embedding(scores);
  const int last = scores.num_samples() - 1;

  // Sample 5 sits inside the chain and was smoothed with both neighbours;
  // `last` has no neighbours and kept its pull-only position.
  for (const int source : {5, last}) {
    CAPTURE(source);
    const auto query = pick_columns(scores, {source}, {"copy"});
    const auto bridge =
        swne::data::SimilarityGraph::bipartite_graph(1, scores.num_samples(), {{0, source, 1.0f}});
    const auto projection =
        swne::ops::project_samples(embedding, query, bridge, swne::data::ProjectParams{});

    REQUIRE(projection.samples.size() == 1);
    CHECK(projection.samples.ids[0] == "copy");
    CHECK(projection.samples.coords(0, 0) ==
          doctest::Approx(embedding.samples.coords(source, 0)).epsilon(swne::test_support::kTolTight));
    CHECK(projection.samples.coords(0, 1) ==
          doctest::Approx(embedding.samples.coords(source, 1)).epsilon(swne::test_support::kTolTight));
    CHECK(projection.diagnostics.clean());
  }

  // The smoothed training position differs from the copy's own pull.
  const auto pulled_only = swne::ops::pull_entities(
      swne::ops::ScoreColumns{pick_columns(scores, {5}, {"copy"}).values}, embedding.anchors, 3,
      1.0f);
  CHECK((pulled_only.positions.row(0).transpose() - embedding.samples.at(5)).norm() >
        swne::test_support::kTolTight);
}

TEST_CASE("projection lands on the weighted mean of fixed training positions") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(4, 6);
  const auto embedding = make_training_embedding(scores);
  const auto before = embedding.samples.coords;

  const auto query = pick_columns(scores, {0, 7}, {"q0", "q1"});
  const auto bridge = swne::data::SimilarityGraph::bipartite_graph(
      2, scores.num_samples(), {{0, 12, 1.0f}, {1, 7, 1.0f}, {1, 8, 0.5f}});
  const auto projection =
      swne::ops::project_samples(embedding, query, bridge, swne::data::ProjectParams{});

  const Eigen::Vector2f expected_q0 = embedding.samples.at(12);
  CHECK(projection.samples.at(0).x() == doctest::Approx(expected_q0.x()));
  CHECK(projection.samples.at(0).y() == doctest::Approx(expected_q0.y()));

  const Eigen::Vector2f expected_q1 =
      (2.0f * embedding.samples.at(7) + embedding.samples.at(8)) / 3.0f;
  CHECK(projection.samples.at(1).x() == doctest::Approx(expected_q1.x()));
  CHECK(projection.samples.at(1).y() == doctest::Approx(expected_q1.y()));

  CHECK(embedding.samples.coords == before);
}

TEST_CASE("projection graph columns resolve by training id") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(4, 6);
  const auto embedding = make_training_embedding(scores);

  const auto query = pick_columns(scores, {3}, {"q"});
  auto bridge = swne::data::SimilarityGraph::bipartite_graph(1, 2, {{0, 1, 1.0f}});
  bridge.set_ids({"q"}, {"sample_2", "sample_10"});
  const auto projection =
      swne::ops::project_samples(embedding, query, bridge, swne::data::ProjectParams{});

  const Eigen::Vector2f expected = embedding.samples.at(9);
  CHECK(projection.samples.at(0).x() == doctest::Approx(expected.x()));
  CHECK(projection.samples.at(0).y() == doctest::Approx(expected.y()));

  bridge.set_ids({"q"}, {"sample_2", "unknown"});
  CHECK_THROWS_AS(swne::ops::project_samples(embedding, query, bridge,
                                             swne::data::ProjectParams{}),
                  swne::ConfigurationError);
}

TEST_CASE("samples without training edges are surfaced") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(4, 6);
  const auto embedding = make_training_embedding(scores);

  const auto query = pick_columns(scores, {2, 5}, {"linked", "stranded"});
  const auto bridge =
      swne::data::SimilarityGraph::bipartite_graph(2, scores.num_samples(), {{0, 2, 0.4f}});

  const auto lenient =
      swne::ops::project_samples(embedding, query, bridge, swne::data::ProjectParams{});
  REQUIRE(lenient.diagnostics.unanchored.size() == 1);
  CHECK(lenient.diagnostics.unanchored[0] == "stranded");
  const auto pulled_only = swne::ops::pull_entities(swne::ops::ScoreColumns{query.values},
                                                    embedding.anchors, 3, 1.0f);
  CHECK(lenient.samples.coords(1, 0) == pulled_only.positions(1, 0));
  CHECK(lenient.samples.coords(1, 1) == pulled_only.positions(1, 1));

  swne::data::ProjectParams strict;
  strict.strict = true;
  CHECK_THROWS_AS(swne::ops::project_samples(embedding, query, bridge, strict),
                  swne::ConfigurationError);
}

TEST_CASE("projection rejects mismatched factors and parameters") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(4, 6);
  const auto embedding = make_training_embedding(scores);
  const auto bridge =
      swne::data::SimilarityGraph::bipartite_graph(1, scores.num_samples(), {{0, 0, 1.0f}});

  const swne::data::FactorScores renamed(scores.values.leftCols(1),
                                         {"w", "x", "y", "z"}, {"q"});
  CHECK_THROWS_AS(swne::ops::project_samples(embedding, renamed, bridge,
                                             swne::data::ProjectParams{}),
                  swne::ConfigurationError);

  const auto query = pick_columns(scores, {0}, {"q"});
  swne::data::ProjectParams params;
  params.n_pull = 2;
  CHECK_THROWS_AS(swne::ops::project_samples(embedding, query, bridge, params),
                  swne::ConfigurationError);

  const auto too_narrow = swne::data::SimilarityGraph::bipartite_graph(1, 3, {{0, 0, 1.0f}});
  CHECK_THROWS_AS(swne::ops::project_samples(embedding, query, too_narrow,
                                             swne::data::ProjectParams{}),
                  swne::ConfigurationError);
}

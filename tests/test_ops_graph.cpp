#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <Eigen/Dense>
#include <swne/ops/graph/pca.hpp>
#include <swne/ops/graph/snn.hpp>

#include "support/synthetic_data.hpp"
#include "support/test_env.hpp"
#include "support/tolerances.hpp"

TEST_CASE("PCA captures the dominant direction and transforms new data") {
  swne::test_support::configure_deterministic_test_env();
  Eigen::MatrixXf A(3, 6);
  A << 0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f,
       0.0f, 2.0f, 4.0f, 6.0f, 8.0f, 10.0f,
       1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f;

  const auto model = swne::ops::graph::compute_pca(A, 2);
  CHECK(model.num_components() == 2);
  CHECK(model.center[0] == doctest::Approx(2.5f));
  CHECK(model.center[2] == doctest::Approx(1.0f));
  CHECK(model.variances[0] > 0.0f);
  CHECK(model.variances[1] == doctest::Approx(0.0f).epsilon(swne::test_support::kTolLoose));

  // The first axis is (1, 2, 0) / sqrt(5).
  CHECK(std::abs(model.rotation(0, 0)) ==
        doctest::Approx(1.0f / std::sqrt(5.0f)).epsilon(swne::test_support::kTolLoose));
  CHECK(std::abs(model.rotation(2, 0)) < swne::test_support::kTolLoose);

  const Eigen::MatrixXf again = model.transform(A);
  CHECK((again.row(0) - model.embeddings.row(0)).norm() < swne::test_support::kTolLoose);

  CHECK_THROWS_AS(swne::ops::graph::compute_pca(A, 0), swne::ConfigurationError);
  CHECK_THROWS_AS(model.transform(Eigen::MatrixXf::Zero(2, 1)), swne::ConfigurationError);
}

TEST_CASE("SNN graph links points only within their cluster") {
  swne::test_support::configure_deterministic_test_env();
  const Eigen::MatrixXf points = swne::test_support::make_point_clusters(3, 3, 15);

  swne::ops::graph::SnnOptions options;
  options.k = 10;
  const auto graph = swne::ops::graph::build_snn_graph(points, options);

  REQUIRE(graph.rows() == 45);
  CHECK(graph.num_edges() > 0);
  CHECK_NOTHROW(graph.validate_sample_graph());
  for (int i = 0; i < graph.rows(); ++i) {
    const auto row = graph.row(i);
    CHECK_FALSE(row.empty());
    for (size_t e = 0; e < row.size(); ++e) {
      CHECK(row.cols[e] / 15 == i / 15);
      CHECK(row.weights[e] >= options.prune);
      CHECK(row.weights[e] <= 1.0f);
    }
  }
}

TEST_CASE("Jaccard overlap counts shared neighbours") {
  const int a[4] = {0, 1, 2, 3};
  const int b[4] = {2, 3, 4, 5};
  const int c[4] = {0, 1, -1, -1};
  CHECK(swne::ops::graph::jaccard(a, b, 4) == doctest::Approx(2.0f / 6.0f));
  CHECK(swne::ops::graph::jaccard(a, a, 4) == doctest::Approx(1.0f));
  CHECK(swne::ops::graph::jaccard(a, c, 4) == doctest::Approx(0.5f));
}

TEST_CASE("projection graph connects queries to their own cluster") {
  swne::test_support::configure_deterministic_test_env();
  const Eigen::MatrixXf train = swne::test_support::make_point_clusters(3, 3, 15, 5);
  const Eigen::MatrixXf query = swne::test_support::make_point_clusters(3, 3, 2, 99);

  swne::ops::graph::SnnOptions options;
  options.k = 8;
  const auto graph = swne::ops::graph::build_projection_graph(train, query, options);

  REQUIRE(graph.rows() == 6);
  CHECK(graph.cols() == 45);
  for (int q = 0; q < graph.rows(); ++q) {
    const auto row = graph.row(q);
    CHECK_FALSE(row.empty());
    for (size_t e = 0; e < row.size(); ++e) {
      CHECK(row.cols[e] / 15 == q / 2);
    }
  }

  CHECK_THROWS_AS(swne::ops::graph::build_projection_graph(train, Eigen::MatrixXf::Zero(2, 1),
                                                           options),
                  swne::ConfigurationError);
  options.k = 1;
  CHECK_THROWS_AS(swne::ops::graph::build_snn_graph(train, options), swne::ConfigurationError);
}

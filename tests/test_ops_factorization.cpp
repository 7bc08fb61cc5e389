#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <Eigen/Dense>
#include <swne/ops/factorization/nmf.hpp>
#include <swne/ops/linalg.hpp>

#include "support/synthetic_data.hpp"
#include "support/test_env.hpp"
#include "support/tolerances.hpp"

TEST_CASE("thin SVD matches the dense decomposition") {
  swne::test_support::configure_deterministic_test_env();
  const auto data = swne::test_support::make_low_rank_data(3, 30, 40);

  const swne::ops::ThinSvd svd = swne::ops::thin_svd(data.A, 3);
  Eigen::JacobiSVD<Eigen::MatrixXf> reference(data.A);

  for (int i = 0; i < 3; ++i) {
    CHECK(svd.S[i] == doctest::Approx(reference.singularValues()[i]).epsilon(swne::test_support::kTolLoose));
  }
  const Eigen::MatrixXf rebuilt = svd.U * svd.S.asDiagonal() * svd.V.transpose();
  CHECK((rebuilt - data.A).norm() / data.A.norm() < swne::test_support::kTolLoose);

  const Eigen::MatrixXf wide = data.A.transpose();
  const swne::ops::ThinSvd wide_svd = swne::ops::thin_svd(wide, 2);
  CHECK(wide_svd.U.rows() == wide.rows());
  CHECK(wide_svd.V.rows() == wide.cols());
  CHECK(wide_svd.S[0] == doctest::Approx(svd.S[0]).epsilon(swne::test_support::kTolLoose));

  CHECK_THROWS_AS(swne::ops::thin_svd(data.A, 0), swne::ConfigurationError);
}

TEST_CASE("NMF recovers an exact low-rank product with both losses") {
  swne::test_support::configure_deterministic_test_env();
  const auto data = swne::test_support::make_low_rank_data(3, 10, 12);

  for (auto loss : {swne::ops::factorization::NmfLoss::SquaredError,
                    swne::ops::factorization::NmfLoss::KullbackLeibler}) {
    swne::ops::factorization::NmfOptions options;
    options.k = 3;
    options.loss = loss;
    options.max_iterations = 2000;
    options.tolerance = 1e-7f;
    const auto result = swne::ops::factorization::run_nmf(data.A, options);

    CHECK(result.W.rows() == data.A.rows());
    CHECK(result.H.cols() == data.A.cols());
    CHECK(result.W.minCoeff() >= 0.0f);
    CHECK(result.H.minCoeff() >= 0.0f);
    CHECK(result.iterations > 0);
    const Eigen::MatrixXf residual = data.A - result.W * result.H;
    CHECK(residual.norm() / data.A.norm() < 0.1f);
  }
}

TEST_CASE("seeded random initialisation is reproducible") {
  swne::test_support::configure_deterministic_test_env();
  const auto data = swne::test_support::make_low_rank_data(4, 5, 6);

  swne::ops::factorization::NmfOptions options;
  options.k = 4;
  options.init = swne::ops::factorization::NmfInit::Random;
  options.max_iterations = 50;
  options.seed = 9;
  const auto first = swne::ops::factorization::run_nmf(data.A, options);
  const auto second = swne::ops::factorization::run_nmf(data.A, options);
  CHECK(first.W == second.W);
  CHECK(first.H == second.H);

  options.seed = 10;
  const auto third = swne::ops::factorization::run_nmf(data.A, options);
  CHECK_FALSE(first.W == third.W);
}

TEST_CASE("NMF output wraps into labelled scores and loadings") {
  swne::test_support::configure_deterministic_test_env();
  const auto data = swne::test_support::make_low_rank_data(3, 4, 5);
  swne::ops::factorization::NmfOptions options;
  options.k = 3;
  options.max_iterations = 20;
  const auto result = swne::ops::factorization::run_nmf(data.A, options);

  const auto scores = swne::ops::factorization::to_scores(
      result, swne::data::sequential_ids("cell_", static_cast<size_t>(data.A.cols())));
  const auto loadings = swne::ops::factorization::to_loadings(
      result, swne::data::sequential_ids("gene_", static_cast<size_t>(data.A.rows())));
  CHECK(scores.factor_ids == loadings.factor_ids);
  CHECK(scores.sample_ids[0] == "cell_1");
  CHECK_NOTHROW(scores.validate());
  CHECK_NOTHROW(loadings.validate());
}

TEST_CASE("NMF rejects negative input and impossible ranks") {
  swne::test_support::configure_deterministic_test_env();
  auto data = swne::test_support::make_low_rank_data(3, 4, 4);
  swne::ops::factorization::NmfOptions options;
  options.k = 3;

  Eigen::MatrixXf negative = data.A;
  negative(2, 3) = -0.5f;
  CHECK_THROWS_AS(swne::ops::factorization::run_nmf(negative, options), swne::ConfigurationError);

  options.k = 50;
  CHECK_THROWS_AS(swne::ops::factorization::run_nmf(data.A, options), swne::ConfigurationError);

  CHECK_THROWS_AS(swne::ops::factorization::parse_nmf_loss("frobenius"), swne::ConfigurationError);
  CHECK((swne::ops::factorization::parse_nmf_init("nndsvd") ==
         swne::ops::factorization::NmfInit::Nndsvd));
}

TEST_CASE("projected scores solve the nonnegative least squares problem") {
  swne::test_support::configure_deterministic_test_env();
  const auto data = swne::test_support::make_low_rank_data(3, 6, 5);

  const Eigen::MatrixXf H = swne::ops::factorization::project_scores(data.W, data.A);
  CHECK(H.rows() == 3);
  CHECK(H.cols() == data.A.cols());
  CHECK(H.minCoeff() >= 0.0f);
  CHECK((H - data.H).norm() / data.H.norm() < swne::test_support::kTolLoose);

  // A column pointing away from every loading gets zero scores.
  Eigen::MatrixXf W(2, 2);
  W << 1.0f, 0.0f,
       0.0f, 1.0f;
  Eigen::MatrixXf a(2, 1);
  a << 0.0f, 2.0f;
  const Eigen::MatrixXf h = swne::ops::factorization::project_scores(W, a);
  CHECK(h(0, 0) == 0.0f);
  CHECK(h(1, 0) == doctest::Approx(2.0f));

  CHECK_THROWS_AS(swne::ops::factorization::project_scores(data.W, W), swne::ConfigurationError);
}

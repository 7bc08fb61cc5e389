#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/core/parallel.hpp>
#include <swne/data/matrices.hpp>
#include <swne/ops/linalg.hpp>

namespace swne::ops::factorization {

/// \brief Reconstruction loss minimised by the multiplicative updates.
enum class NmfLoss {
  SquaredError,
  KullbackLeibler
};

/// \brief Starting point for `W` and `H`.
enum class NmfInit {
  Random,
  Nndsvd
};

inline NmfLoss parse_nmf_loss(std::string_view text) {
  if (text == "mse") {
    return NmfLoss::SquaredError;
  }
  if (text == "mkl") {
    return NmfLoss::KullbackLeibler;
  }
  fail_config("unknown NMF loss '{}' (expected mse or mkl)", text);
}

inline NmfInit parse_nmf_init(std::string_view text) {
  if (text == "random") {
    return NmfInit::Random;
  }
  if (text == "nndsvd") {
    return NmfInit::Nndsvd;
  }
  fail_config("unknown NMF init '{}' (expected random or nndsvd)", text);
}

struct NmfOptions {
  int k = 10;
  NmfLoss loss = NmfLoss::SquaredError;
  NmfInit init = NmfInit::Nndsvd;
  int max_iterations = 500;
  /// \brief Stop when the relative change of the loss drops below this.
  float tolerance = 1e-4f;
  uint32_t seed = 42;
};

/// \brief `A ~ W H` with `W` features x k and `H` k x samples.
struct NmfResult {
  Eigen::MatrixXf W;
  Eigen::MatrixXf H;
  /// \brief Mean squared error or mean generalised KL divergence.
  float error = 0.0f;
  int iterations = 0;
};

constexpr float kNmfEps = 1e-10f;

/// \brief Mean reconstruction loss of `W H` against `A`.
inline float nmf_loss(const Eigen::MatrixXf &A, const Eigen::MatrixXf &W,
                      const Eigen::MatrixXf &H, NmfLoss loss) {
  const Eigen::MatrixXf WH = W * H;
  const float count = static_cast<float>(std::max<Eigen::Index>(1, A.size()));
  if (loss == NmfLoss::SquaredError) {
    return (A - WH).squaredNorm() / count;
  }

  double total = 0.0;
  for (Eigen::Index i = 0; i < A.size(); ++i) {
    const double a = A.data()[i];
    const double wh = std::max<double>(WH.data()[i], kNmfEps);
    total += (a > 0.0 ? a * std::log(a / wh) : 0.0) - a + wh;
  }
  return static_cast<float>(total / count);
}

/**
 * \brief Seeded uniform start scaled to the data magnitude.
 */
inline void init_random(const Eigen::MatrixXf &A, int k, uint32_t seed, Eigen::MatrixXf &W,
                        Eigen::MatrixXf &H) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> dist(0.0f, 1.0f);
  const float scale = std::sqrt(std::max(A.mean(), kNmfEps) / static_cast<float>(k));

  W.resize(A.rows(), k);
  H.resize(k, A.cols());
  for (Eigen::Index i = 0; i < W.size(); ++i) {
    W.data()[i] = scale * dist(gen);
  }
  for (Eigen::Index i = 0; i < H.size(); ++i) {
    H.data()[i] = scale * dist(gen);
  }
}

/**
 * \brief Nonnegative double SVD start (Boutsidis and Gallopoulos).
 *
 * Zeros are filled with the mean of `A` so multiplicative updates can move
 * every entry.
 */
inline void init_nndsvd(const Eigen::MatrixXf &A, int k, Eigen::MatrixXf &W, Eigen::MatrixXf &H) {
  const ThinSvd svd = thin_svd(A, k);
  W = Eigen::MatrixXf::Zero(A.rows(), k);
  H = Eigen::MatrixXf::Zero(k, A.cols());

  W.col(0) = std::sqrt(svd.S[0]) * svd.U.col(0).cwiseAbs();
  H.row(0) = std::sqrt(svd.S[0]) * svd.V.col(0).cwiseAbs().transpose();

  for (int j = 1; j < k; ++j) {
    const Eigen::VectorXf x = svd.U.col(j);
    const Eigen::VectorXf y = svd.V.col(j);
    const Eigen::VectorXf xp = x.cwiseMax(0.0f);
    const Eigen::VectorXf xn = (-x).cwiseMax(0.0f);
    const Eigen::VectorXf yp = y.cwiseMax(0.0f);
    const Eigen::VectorXf yn = (-y).cwiseMax(0.0f);

    const float xp_norm = xp.norm();
    const float yp_norm = yp.norm();
    const float xn_norm = xn.norm();
    const float yn_norm = yn.norm();
    const float m_pos = xp_norm * yp_norm;
    const float m_neg = xn_norm * yn_norm;

    const bool use_pos = m_pos >= m_neg;
    const float m = use_pos ? m_pos : m_neg;
    if (m <= 0.0f) {
      continue;
    }
    const float lambda = std::sqrt(svd.S[j] * m);
    if (use_pos) {
      W.col(j) = lambda * xp / xp_norm;
      H.row(j) = lambda * (yp / yp_norm).transpose();
    } else {
      W.col(j) = lambda * xn / xn_norm;
      H.row(j) = lambda * (yn / yn_norm).transpose();
    }
  }

  const float fill = std::max(A.mean(), kNmfEps);
  W = (W.array() > 0.0f).select(W.array(), fill).matrix();
  H = (H.array() > 0.0f).select(H.array(), fill).matrix();
}

/**
 * \brief Lee-Seung multiplicative-update NMF.
 *
 * \param A Nonnegative features x samples matrix.
 * \param options Rank, loss, initialisation and stopping rule.
 * \throws ConfigurationError on negative input or an invalid rank.
 */
inline NmfResult run_nmf(const Eigen::MatrixXf &A, const NmfOptions &options) {
  data::require_nonnegative(A, "NMF input");
  const int k = options.k;
  if (k < 1 || k > std::min(A.rows(), A.cols())) {
    fail_config("NMF rank {} is invalid for a {} x {} matrix", k, A.rows(), A.cols());
  }
  if (options.max_iterations < 0) {
    fail_config("NMF max_iterations must be nonnegative, got {}", options.max_iterations);
  }

  NmfResult result;
  if (options.init == NmfInit::Nndsvd) {
    init_nndsvd(A, k, result.W, result.H);
  } else {
    init_random(A, k, options.seed, result.W, result.H);
  }

  float previous = nmf_loss(A, result.W, result.H, options.loss);
  int iter = 0;
  for (; iter < options.max_iterations; ++iter) {
    Eigen::MatrixXf &W = result.W;
    Eigen::MatrixXf &H = result.H;

    if (options.loss == NmfLoss::SquaredError) {
      const Eigen::MatrixXf WtA = W.transpose() * A;
      const Eigen::MatrixXf WtWH = (W.transpose() * W) * H;
      H = H.cwiseProduct(WtA).cwiseQuotient(WtWH.array().max(kNmfEps).matrix());

      const Eigen::MatrixXf AHt = A * H.transpose();
      const Eigen::MatrixXf WHHt = W * (H * H.transpose());
      W = W.cwiseProduct(AHt).cwiseQuotient(WHHt.array().max(kNmfEps).matrix());
    } else {
      Eigen::MatrixXf ratio = A.cwiseQuotient((W * H).array().max(kNmfEps).matrix());
      const Eigen::VectorXf w_sums = W.colwise().sum().transpose();
      H = H.cwiseProduct(W.transpose() * ratio);
      for (int f = 0; f < k; ++f) {
        H.row(f) /= std::max(w_sums[f], kNmfEps);
      }

      ratio = A.cwiseQuotient((W * H).array().max(kNmfEps).matrix());
      const Eigen::VectorXf h_sums = H.rowwise().sum();
      W = W.cwiseProduct(ratio * H.transpose());
      for (int f = 0; f < k; ++f) {
        W.col(f) /= std::max(h_sums[f], kNmfEps);
      }
    }

    const float current = nmf_loss(A, W, H, options.loss);
    const float change = std::abs(previous - current) / std::max(previous, kNmfEps);
    previous = current;
    if (change < options.tolerance) {
      ++iter;
      break;
    }
  }

  result.error = previous;
  result.iterations = iter;
  core::log_info("NMF", "k={} converged to loss {:.6g} in {} iterations", k, result.error,
                 result.iterations);
  return result;
}

/// \brief Wrap `result.W` as feature loadings named `factor_1 .. factor_k`.
inline data::FeatureLoadings to_loadings(const NmfResult &result,
                                         std::vector<std::string> feature_ids) {
  return data::FeatureLoadings(result.W, std::move(feature_ids),
                               data::sequential_ids("factor_", static_cast<size_t>(result.W.cols())));
}

/// \brief Wrap `result.H` as factor scores named `factor_1 .. factor_k`.
inline data::FactorScores to_scores(const NmfResult &result, std::vector<std::string> sample_ids) {
  return data::FactorScores(result.H,
                            data::sequential_ids("factor_", static_cast<size_t>(result.H.rows())),
                            std::move(sample_ids));
}

/**
 * \brief Nonnegative least squares scores for new columns against fixed `W`.
 *
 * Cyclic coordinate descent on `(W^T W) h = W^T a` per column; columns are
 * solved independently.
 * \param W Features x k loadings from a previous factorization.
 * \param A_new Features x n_new data in the same feature order.
 * \return k x n_new nonnegative scores.
 */
inline Eigen::MatrixXf project_scores(const Eigen::MatrixXf &W, const Eigen::MatrixXf &A_new,
                                      int max_sweeps = 100, float tolerance = 1e-8f) {
  if (W.rows() != A_new.rows()) {
    fail_config("loadings have {} features but new data has {}", W.rows(), A_new.rows());
  }
  data::require_nonnegative(A_new, "projected data");

  const int k = static_cast<int>(W.cols());
  Eigen::MatrixXf gram = W.transpose() * W;
  gram.diagonal().array() += 1e-12f;
  const Eigen::MatrixXf rhs = W.transpose() * A_new;
  Eigen::MatrixXf H = Eigen::MatrixXf::Zero(k, A_new.cols());

  core::parallel_for_index(0, static_cast<int>(A_new.cols()), [&](int col) {
    Eigen::VectorXf b = rhs.col(col);
    Eigen::VectorXf h = Eigen::VectorXf::Zero(k);
    for (int sweep = 0; sweep < max_sweeps; ++sweep) {
      float moved = 0.0f;
      for (int f = 0; f < k; ++f) {
        const float updated = std::max(0.0f, h[f] + b[f] / gram(f, f));
        const float delta = updated - h[f];
        if (delta != 0.0f) {
          b -= gram.col(f) * delta;
          h[f] = updated;
          moved += std::abs(delta) / (updated + 1e-15f);
        }
      }
      if (moved / static_cast<float>(k) < tolerance) {
        break;
      }
    }
    H.col(col) = h;
  });
  return H;
}

} // namespace swne::ops::factorization

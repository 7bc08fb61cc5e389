#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <random>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/data/embedding.hpp>
#include <swne/data/matrices.hpp>

namespace swne::ops {

using data::CoordinateMap;
using data::DistanceMode;
using data::FactorScores;
using data::Positions;
using data::ProjectionMethod;

/// \brief Smallest anchor separation (in unit-box coordinates) treated as distinct.
constexpr float kMinAnchorSeparation = 1e-6f;

/**
 * \brief Per-sample information weights `1 - H(p_j) / log(k)`.
 *
 * `p_j` is column `j` normalised to a distribution over factors. A sample
 * loading on a single factor gets weight 1, a uniform one gets 0.
 */
inline Eigen::VectorXf sample_information_weights(const Eigen::MatrixXf &scores) {
  const int k = static_cast<int>(scores.rows());
  const int n = static_cast<int>(scores.cols());
  Eigen::VectorXf weights = Eigen::VectorXf::Zero(n);
  if (k < 2) {
    return weights;
  }

  const float log_k = std::log(static_cast<float>(k));
  for (int j = 0; j < n; ++j) {
    const float total = scores.col(j).sum();
    if (total <= 0.0f) {
      continue;
    }
    float entropy = 0.0f;
    for (int f = 0; f < k; ++f) {
      const float p = scores(f, j) / total;
      if (p > 0.0f) {
        entropy -= p * std::log(p);
      }
    }
    weights[j] = std::clamp(1.0f - entropy / log_k, 0.0f, 1.0f);
  }
  return weights;
}

/**
 * \brief Pairwise factor dissimilarity (`k x k`, zero diagonal).
 *
 * Both modes are `1 - cosine` between factor score rows; the information
 * content mode weights each sample by `sample_information_weights`.
 */
inline Eigen::MatrixXf factor_distances(const Eigen::MatrixXf &scores, DistanceMode mode) {
  const int k = static_cast<int>(scores.rows());

  Eigen::MatrixXf weighted = scores;
  if (mode == DistanceMode::InformationContent) {
    const Eigen::VectorXf w = sample_information_weights(scores);
    if (w.sum() > 0.0f) {
      weighted = scores.array().rowwise() * w.transpose().array();
    } else {
      core::log_warn("Anchors", "no sample carries factor information, using cosine distance");
    }
  }

  // <h_a, w * h_b> for all pairs; cosine mode has w = 1.
  const Eigen::MatrixXf gram = weighted * scores.transpose();
  Eigen::MatrixXf dist = Eigen::MatrixXf::Zero(k, k);
  for (int a = 0; a < k; ++a) {
    for (int b = a + 1; b < k; ++b) {
      const float denom = std::sqrt(std::max(gram(a, a), 0.0f) * std::max(gram(b, b), 0.0f));
      const float sim = denom > 0.0f ? std::clamp(gram(a, b) / denom, -1.0f, 1.0f) : 0.0f;
      dist(a, b) = 1.0f - sim;
      dist(b, a) = dist(a, b);
    }
  }
  return dist;
}

/// \brief Strategy that reduces a `k x k` dissimilarity matrix to `k x 2`.
template <typename T>
concept AnchorProjector = requires(const T &projector, const Eigen::MatrixXf &dist, uint32_t seed) {
  { projector.project(dist, seed) } -> std::same_as<Positions>;
};

/**
 * \brief Classical scaling: top two principal axes of the double-centred
 *        squared dissimilarities.
 */
struct PcaProjector {
  [[nodiscard]] Positions project(const Eigen::MatrixXf &dist, uint32_t /*seed*/) const {
    const int k = static_cast<int>(dist.rows());
    const Eigen::MatrixXd sq = dist.cast<double>().array().square().matrix();
    const Eigen::VectorXd row_mean = sq.rowwise().mean();
    const double grand_mean = row_mean.mean();

    Eigen::MatrixXd centred(k, k);
    for (int i = 0; i < k; ++i) {
      for (int j = 0; j < k; ++j) {
        centred(i, j) = -0.5 * (sq(i, j) - row_mean[i] - row_mean[j] + grand_mean);
      }
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(centred);
    Positions out = Positions::Zero(k, 2);
    if (solver.info() != Eigen::Success) {
      core::log_warn("Anchors", "classical scaling eigensolve failed");
      return out;
    }

    // Eigenvalues ascend; take the two largest and fix each axis' sign so the
    // largest-magnitude entry is positive.
    for (int axis = 0; axis < 2; ++axis) {
      const int col = k - 1 - axis;
      const double lambda = std::max(solver.eigenvalues()[col], 0.0);
      Eigen::VectorXd v = solver.eigenvectors().col(col);
      Eigen::Index pivot = 0;
      v.cwiseAbs().maxCoeff(&pivot);
      if (v[pivot] < 0.0) {
        v = -v;
      }
      out.col(axis) = (v * std::sqrt(lambda)).cast<float>();
    }
    return out;
  }
};

/**
 * \brief Sammon mapping initialised from classical scaling.
 *
 * Diagonal-Newton updates with step halving on stress increase.
 */
struct SammonProjector {
  int max_iterations = 100;
  double tolerance = 1e-4;
  double magic = 0.2;

  [[nodiscard]] Positions project(const Eigen::MatrixXf &dist, uint32_t seed) const;
};

/**
 * \brief Push apart anchors closer than `min_separation` with seeded jitter.
 * \return Number of jitter rounds applied.
 */
inline int separate_coincident(Positions &coords, uint32_t seed,
                               float min_separation = kMinAnchorSeparation) {
  const int k = static_cast<int>(coords.rows());
  const float extent = std::max(
      {coords.col(0).maxCoeff() - coords.col(0).minCoeff(),
       coords.col(1).maxCoeff() - coords.col(1).minCoeff(), 1e-3f});

  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> jitter(-1.0f, 1.0f);

  int rounds = 0;
  for (; rounds < 64; ++rounds) {
    bool moved = false;
    for (int a = 0; a < k; ++a) {
      for (int b = a + 1; b < k; ++b) {
        if ((coords.row(a) - coords.row(b)).norm() >= min_separation * extent) {
          continue;
        }
        coords(b, 0) += 0.01f * extent * jitter(gen);
        coords(b, 1) += 0.01f * extent * jitter(gen);
        moved = true;
      }
    }
    if (!moved) {
      break;
    }
  }
  return rounds;
}

/// \brief Rescale each axis to `[0, 1]`; a flat axis maps to `0.5`.
inline void normalize_unit_box(Positions &coords) {
  for (int axis = 0; axis < 2; ++axis) {
    const float lo = coords.col(axis).minCoeff();
    const float hi = coords.col(axis).maxCoeff();
    if (hi - lo > 0.0f) {
      coords.col(axis) = (coords.col(axis).array() - lo) / (hi - lo);
    } else {
      coords.col(axis).setConstant(0.5f);
    }
  }
}

inline Positions SammonProjector::project(const Eigen::MatrixXf &dist, uint32_t seed) const {
  const int k = static_cast<int>(dist.rows());
  Positions init = PcaProjector{}.project(dist, seed);
  separate_coincident(init, seed);

  Eigen::MatrixXd d = dist.cast<double>();
  constexpr double kFloor = 1e-9;
  double scale = 0.0;
  for (int i = 0; i < k; ++i) {
    for (int j = i + 1; j < k; ++j) {
      d(i, j) = std::max(d(i, j), kFloor);
      d(j, i) = d(i, j);
      scale += d(i, j);
    }
  }

  Eigen::MatrixXd y = init.cast<double>();
  const auto stress = [&](const Eigen::MatrixXd &pts) {
    double e = 0.0;
    for (int i = 0; i < k; ++i) {
      for (int j = i + 1; j < k; ++j) {
        const double dd = std::max((pts.row(i) - pts.row(j)).norm(), kFloor);
        e += (d(i, j) - dd) * (d(i, j) - dd) / d(i, j);
      }
    }
    return e / scale;
  };

  double e = stress(y);
  int iter = 0;
  for (; iter < max_iterations; ++iter) {
    Eigen::MatrixXd step = Eigen::MatrixXd::Zero(k, 2);
    for (int i = 0; i < k; ++i) {
      for (int m = 0; m < 2; ++m) {
        double grad = 0.0;
        double hess = 0.0;
        for (int j = 0; j < k; ++j) {
          if (j == i) {
            continue;
          }
          const double dd = std::max((y.row(i) - y.row(j)).norm(), kFloor);
          const double dij = d(i, j);
          const double diff = y(i, m) - y(j, m);
          const double dq = dij - dd;
          const double pd = dd * dij;
          grad += dq / pd * diff;
          hess += (dq - diff * diff / dd * (1.0 + dq / dd)) / pd;
        }
        grad *= -2.0 / scale;
        hess *= -2.0 / scale;
        step(i, m) = grad / std::max(std::abs(hess), 1e-12);
      }
    }

    double e_new = e;
    Eigen::MatrixXd candidate = y;
    double factor = magic;
    bool improved = false;
    for (int halving = 0; halving < 20; ++halving) {
      candidate = y - factor * step;
      e_new = stress(candidate);
      if (e_new <= e) {
        improved = true;
        break;
      }
      factor *= 0.2;
    }
    if (!improved) {
      break;
    }

    const double rel = std::abs(e - e_new) / std::max(e, 1e-300);
    y = candidate;
    e = e_new;
    if (rel < tolerance) {
      ++iter;
      break;
    }
  }

  core::log_info("Anchors", "Sammon stress {:.4g} after {} iterations", e, iter);
  return y.cast<float>();
}

/**
 * \brief Anchor coordinates for the factors of `scores` using `projector`.
 *
 * Coordinates are normalised to the unit box and guaranteed pairwise
 * distinct. Requires at least three factors.
 */
template <AnchorProjector Projector>
CoordinateMap compute_anchor_layout(const FactorScores &scores, DistanceMode mode,
                                    const Projector &projector, uint32_t seed) {
  const int k = scores.num_factors();
  if (k < 3) {
    fail_config("anchor layout needs at least 3 factors, got {}", k);
  }

  const Eigen::MatrixXf dist = factor_distances(scores.values, mode);
  Positions coords = projector.project(dist, seed);
  if (coords.rows() != k) {
    fail_config("anchor projector returned {} points for {} factors", coords.rows(), k);
  }

  normalize_unit_box(coords);
  if (separate_coincident(coords, seed) > 0) {
    core::log_warn("Anchors", "coincident factor anchors separated by seeded jitter");
    normalize_unit_box(coords);
  }

  core::log_info("Anchors", "placed {} factor anchors ({} distance)", k,
                 data::to_string(mode));
  return CoordinateMap(scores.factor_ids.ids(), std::move(coords));
}

/// \brief Runtime dispatch over the built-in projection strategies.
inline CoordinateMap compute_anchor_layout(const FactorScores &scores, DistanceMode mode,
                                           ProjectionMethod method, uint32_t seed) {
  if (method == ProjectionMethod::Pca) {
    return compute_anchor_layout(scores, mode, PcaProjector{}, seed);
  }
  return compute_anchor_layout(scores, mode, SammonProjector{}, seed);
}

} // namespace swne::ops

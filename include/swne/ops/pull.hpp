#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <span>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/parallel.hpp>
#include <swne/data/embedding.hpp>

namespace swne::ops {

using data::CoordinateMap;
using data::Positions;

/// \brief Weights of the anchors pulling one entity.
struct PullWeights {
  /// \brief Selected factor indices, highest loading first.
  std::vector<int> factors;
  /// \brief Convex weights aligned with `factors` (sum to 1).
  std::vector<float> weights;
  /// \brief All selected loadings were zero; `weights` is uniform.
  bool zero_loading = false;
};

/// \brief Reject `n_pull` outside `[3, k]` or a non-positive sharpness.
inline void validate_pull_params(int n_pull, float alpha_exp, int n_factors) {
  if (n_pull < 3) {
    fail_config("n_pull must be at least 3, got {}", n_pull);
  }
  if (n_pull > n_factors) {
    fail_config("n_pull ({}) exceeds the number of factors ({})", n_pull, n_factors);
  }
  if (!(alpha_exp > 0.0f) || !std::isfinite(alpha_exp)) {
    fail_config("alpha_exp must be a positive finite number, got {}", alpha_exp);
  }
}

/**
 * \brief Select the `n_pull` largest loadings and turn them into convex weights.
 *
 * Ties are broken by ascending factor index. Selected loadings are divided
 * by the largest one, raised to `alpha_exp` and renormalised, which keeps
 * unbounded NMF scores finite under large exponents. An all-zero selection
 * falls back to uniform weights and sets `zero_loading`.
 * \param loading Nonnegative loading over all `k` factors.
 * \param n_pull Number of anchors to keep.
 * \param alpha_exp Sharpness exponent (> 0).
 * \param out Reused output buffers.
 */
inline void compute_pull_weights(std::span<const float> loading, int n_pull, float alpha_exp,
                                 PullWeights &out) {
  const int k = static_cast<int>(loading.size());
  out.factors.resize(static_cast<size_t>(k));
  for (int f = 0; f < k; ++f) {
    out.factors[static_cast<size_t>(f)] = f;
  }

  const auto by_loading = [&](int a, int b) {
    const float la = loading[static_cast<size_t>(a)];
    const float lb = loading[static_cast<size_t>(b)];
    return la != lb ? la > lb : a < b;
  };
  std::partial_sort(out.factors.begin(), out.factors.begin() + n_pull, out.factors.end(),
                    by_loading);
  out.factors.resize(static_cast<size_t>(n_pull));

  out.weights.resize(static_cast<size_t>(n_pull));
  // factors[0] holds the largest selected loading.
  const float top = loading[static_cast<size_t>(out.factors[0])];
  out.zero_loading = !(top > 0.0f);
  if (out.zero_loading) {
    std::fill(out.weights.begin(), out.weights.end(), 1.0f / static_cast<float>(n_pull));
    return;
  }

  // Ratios to the top loading lie in [0, 1], so the power cannot overflow and
  // the leading term stays exactly 1.
  float total = 0.0f;
  for (int p = 0; p < n_pull; ++p) {
    const float value = loading[static_cast<size_t>(out.factors[static_cast<size_t>(p)])];
    const float w = value > 0.0f ? std::pow(value / top, alpha_exp) : 0.0f;
    out.weights[static_cast<size_t>(p)] = w;
    total += w;
  }
  for (float &w : out.weights) {
    w /= total;
  }
}

/// \brief Convex combination of the selected anchors.
inline Eigen::Vector2f pull_position(const PullWeights &pull, const CoordinateMap &anchors) {
  Eigen::Vector2f pos = Eigen::Vector2f::Zero();
  for (size_t p = 0; p < pull.factors.size(); ++p) {
    pos += pull.weights[p] * anchors.at(pull.factors[p]);
  }
  return pos;
}

/**
 * \brief Source of per-entity loading vectors over the anchor factors.
 *
 * Samples (score columns) and features (loading rows) are both pulled
 * through this interface.
 */
template <typename T>
concept LoadingSource = requires(const T &src, int entity, std::span<float> out) {
  { src.num_entities() } -> std::convertible_to<int>;
  { src.num_factors() } -> std::convertible_to<int>;
  { src.load(entity, out) } -> std::same_as<void>;
};

/// \brief Columns of a `k x n` score matrix.
struct ScoreColumns {
  const Eigen::MatrixXf &scores;

  [[nodiscard]] int num_entities() const { return static_cast<int>(scores.cols()); }
  [[nodiscard]] int num_factors() const { return static_cast<int>(scores.rows()); }
  void load(int entity, std::span<float> out) const {
    const float *col = scores.data() + static_cast<size_t>(entity) * scores.rows();
    std::copy(col, col + scores.rows(), out.begin());
  }
};

/// \brief Selected rows of an `m x k` loading matrix.
struct LoadingRows {
  const Eigen::MatrixXf &loadings;
  std::span<const int> rows;

  [[nodiscard]] int num_entities() const { return static_cast<int>(rows.size()); }
  [[nodiscard]] int num_factors() const { return static_cast<int>(loadings.cols()); }
  void load(int entity, std::span<float> out) const {
    const int r = rows[static_cast<size_t>(entity)];
    for (int f = 0; f < loadings.cols(); ++f) {
      out[static_cast<size_t>(f)] = loadings(r, f);
    }
  }
};

/// \brief Provisional positions plus the zero-loading flag per entity.
struct PullResult {
  Positions positions;
  std::vector<uint8_t> zero_loading;

  [[nodiscard]] int num_zero_loading() const {
    return static_cast<int>(std::count(zero_loading.begin(), zero_loading.end(), uint8_t{1}));
  }
};

/**
 * \brief Pull every entity of `source` toward its top `n_pull` anchors.
 *
 * Entities are independent; each writes only its own output row.
 */
template <LoadingSource Source>
PullResult pull_entities(const Source &source, const CoordinateMap &anchors, int n_pull,
                         float alpha_exp) {
  const int k = source.num_factors();
  if (k != anchors.size()) {
    fail_config("loading vectors span {} factors but there are {} anchors", k, anchors.size());
  }
  validate_pull_params(n_pull, alpha_exp, k);

  const int n = source.num_entities();
  PullResult result;
  result.positions.resize(n, 2);
  result.zero_loading.assign(static_cast<size_t>(n), 0);

  core::parallel_for_index(0, n, [&](int i) {
    thread_local std::vector<float> loading;
    thread_local PullWeights pull;
    loading.resize(static_cast<size_t>(k));
    source.load(i, loading);
    compute_pull_weights(loading, n_pull, alpha_exp, pull);
    result.positions.row(i) = pull_position(pull, anchors).transpose();
    result.zero_loading[static_cast<size_t>(i)] = pull.zero_loading ? 1 : 0;
  });
  return result;
}

} // namespace swne::ops

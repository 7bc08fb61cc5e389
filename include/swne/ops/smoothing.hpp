#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/parallel.hpp>
#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>

namespace swne::ops {

using data::NeighborRow;
using data::Positions;
using data::SimilarityGraph;

/// \brief Reject a non-positive or non-finite smoothing exponent.
inline void validate_snn_exp(float snn_exp) {
  if (!(snn_exp > 0.0f) || !std::isfinite(snn_exp)) {
    fail_config("snn_exp must be a positive finite number, got {}", snn_exp);
  }
}

/// \brief Whether a row's own position takes part in its smoothed position.
enum class SelfTerm {
  /// Training samples: own provisional position has raw weight 1.
  Included,
  /// Projected samples: only the fixed training neighbours contribute.
  Excluded
};

/**
 * \brief Self and neighbour weights for one graph row, summing to 1.
 *
 * Neighbour weights are scaled by `r = max(1, max_j w_ij)` and raised to
 * `snn_exp`. With `SelfTerm::Included` the entity's own position gets raw
 * weight 1 (the similarity of an entity with itself); since every scaled
 * weight is at most 1, lowering `snn_exp` raises the neighbours' share.
 * With `SelfTerm::Excluded` the self weight is 0, and a row whose weights
 * are all zero spreads evenly over its neighbours.
 * \param row Graph row of the entity.
 * \param snn_exp Smoothing exponent (> 0).
 * \param neighbor_weights Output, aligned with `row.cols`.
 * \param self Whether the entity's own position is weighted.
 * \return Normalised self weight.
 */
inline float smoothing_weights(const NeighborRow &row, float snn_exp,
                               std::vector<float> &neighbor_weights,
                               SelfTerm self = SelfTerm::Included) {
  neighbor_weights.resize(row.size());
  if (row.empty()) {
    return 1.0f;
  }

  float ref = 1.0f;
  for (float w : row.weights) {
    ref = std::max(ref, w);
  }

  const float self_raw = self == SelfTerm::Included ? 1.0f : 0.0f;
  float total = self_raw;
  for (size_t k = 0; k < row.size(); ++k) {
    const float w = std::pow(row.weights[k] / ref, snn_exp);
    neighbor_weights[k] = w;
    total += w;
  }
  if (!(total > 0.0f)) {
    std::fill(neighbor_weights.begin(), neighbor_weights.end(),
              1.0f / static_cast<float>(row.size()));
    return 0.0f;
  }
  for (float &w : neighbor_weights) {
    w /= total;
  }
  return self_raw / total;
}

/// \brief Smoothed positions plus the no-neighbour flag per row.
struct SmoothingResult {
  Positions positions;
  std::vector<uint8_t> isolated;

  [[nodiscard]] int num_isolated() const {
    return static_cast<int>(std::count(isolated.begin(), isolated.end(), uint8_t{1}));
  }
};

/**
 * \brief One pass of graph smoothing.
 *
 * Row `i` of the result is the convex combination of `own.row(i)` and
 * `neighbors.row(j)` for every edge `(i, j)` of `graph`. Neighbour positions
 * are read-only, so the pass is a single deterministic sweep. For training
 * samples `own` and `neighbors` are the same provisional positions. For
 * projected samples `neighbors` holds the fixed training layout and `self`
 * is `SelfTerm::Excluded`, so a row with edges lands on the weighted mean of
 * its training neighbours. Rows without edges keep `own.row(i)` either way.
 */
inline SmoothingResult smooth_positions(const Positions &own, const SimilarityGraph &graph,
                                        const Positions &neighbors, float snn_exp,
                                        SelfTerm self = SelfTerm::Included) {
  validate_snn_exp(snn_exp);
  if (graph.rows() != own.rows()) {
    fail_config("graph has {} rows but there are {} positions", graph.rows(), own.rows());
  }
  if (graph.cols() != neighbors.rows()) {
    fail_config("graph has {} columns but there are {} neighbour positions", graph.cols(),
                neighbors.rows());
  }

  const int n = static_cast<int>(own.rows());
  SmoothingResult result;
  result.positions.resize(n, 2);
  result.isolated.assign(static_cast<size_t>(n), 0);

  core::parallel_for_index(0, n, [&](int i) {
    thread_local std::vector<float> weights;
    const NeighborRow row = graph.row(i);
    if (row.empty()) {
      result.positions.row(i) = own.row(i);
      result.isolated[static_cast<size_t>(i)] = 1;
      return;
    }

    const float self_weight = smoothing_weights(row, snn_exp, weights, self);
    Eigen::RowVector2f pos = self_weight * own.row(i);
    for (size_t k = 0; k < row.size(); ++k) {
      pos += weights[k] * neighbors.row(row.cols[k]);
    }
    result.positions.row(i) = pos;
  });
  return result;
}

} // namespace swne::ops

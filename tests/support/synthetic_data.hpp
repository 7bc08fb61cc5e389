#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>
#include <swne/data/matrices.hpp>

#include "tolerances.hpp"

namespace swne::test_support {

/**
 * \brief `k x (k * per_factor)` scores where each sample block favours one
 *        factor over a small uniform background.
 */
inline data::FactorScores make_cluster_scores(int k, int per_factor, uint32_t seed = 7,
                                              float background = 0.05f) {
  const int n = k * per_factor;
  Eigen::MatrixXf values(k, n);
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> noise(0.0f, background);
  std::uniform_real_distribution<float> peak(0.6f, 1.0f);

  for (int j = 0; j < n; ++j) {
    const int owner = j / per_factor;
    for (int f = 0; f < k; ++f) {
      values(f, j) = f == owner ? peak(gen) : noise(gen);
    }
  }
  return data::FactorScores(values);
}

/// \brief Anchors on the corners of the unit square in (0,0), (1,0), (0,1), (1,1) order.
inline data::CoordinateMap make_square_anchors() {
  data::Positions coords(4, 2);
  coords << 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f;
  return data::CoordinateMap(data::sequential_ids("factor_", 4), coords);
}

/// \brief Symmetric path graph `0 - 1 - ... - (n-1)` with unit weights.
inline data::SimilarityGraph make_chain_graph(int n, float weight = 1.0f) {
  std::vector<data::GraphEdge> edges;
  for (int i = 0; i + 1 < n; ++i) {
    edges.push_back({i, i + 1, weight});
    edges.push_back({i + 1, i, weight});
  }
  return data::SimilarityGraph::sample_graph(n, std::move(edges));
}

/**
 * \brief Exact nonnegative low-rank product `W H` with block-structured
 *        factors.
 *
 * Feature block `f` and sample block `f` carry factor `f`, so the blocks are
 * well separated and `W` has full column rank.
 */
struct LowRankData {
  Eigen::MatrixXf W;
  Eigen::MatrixXf H;
  Eigen::MatrixXf A;
};

inline LowRankData make_low_rank_data(int k, int features_per_factor, int samples_per_factor,
                                      uint32_t seed = 11) {
  const int m = k * features_per_factor;
  const int n = k * samples_per_factor;
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> strong(0.5f, 1.5f);
  std::uniform_real_distribution<float> weak(0.0f, 0.1f);

  LowRankData out;
  out.W.resize(m, k);
  out.H.resize(k, n);
  for (int i = 0; i < m; ++i) {
    for (int f = 0; f < k; ++f) {
      out.W(i, f) = (i / features_per_factor == f) ? strong(gen) : weak(gen);
    }
  }
  for (int j = 0; j < n; ++j) {
    for (int f = 0; f < k; ++f) {
      out.H(f, j) = (j / samples_per_factor == f) ? strong(gen) : weak(gen);
    }
  }
  out.A = out.W * out.H;
  return out;
}

/// \brief `dims x (clusters * per_cluster)` points around far-apart centres.
inline Eigen::MatrixXf make_point_clusters(int dims, int clusters, int per_cluster,
                                           uint32_t seed = 5, float spread = 0.1f) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> jitter(0.0f, spread);
  Eigen::MatrixXf points(dims, clusters * per_cluster);
  for (int c = 0; c < clusters; ++c) {
    for (int p = 0; p < per_cluster; ++p) {
      const int col = c * per_cluster + p;
      for (int d = 0; d < dims; ++d) {
        const float centre = (d == c % dims) ? 10.0f * static_cast<float>(c + 1) : 0.0f;
        points(d, col) = centre + jitter(gen);
      }
    }
  }
  return points;
}

/**
 * \brief Whether `p` lies in the convex hull of `anchors` (within `tol`).
 *
 * Uses the monotone-chain hull and an edge-side test.
 */
inline bool inside_convex_hull(const data::Positions &anchors, const Eigen::Vector2f &p,
                               float tol = kTolHull) {
  std::vector<Eigen::Vector2f> pts;
  for (int i = 0; i < anchors.rows(); ++i) {
    pts.emplace_back(anchors(i, 0), anchors(i, 1));
  }
  std::sort(pts.begin(), pts.end(), [](const Eigen::Vector2f &a, const Eigen::Vector2f &b) {
    return a.x() != b.x() ? a.x() < b.x() : a.y() < b.y();
  });

  const auto cross = [](const Eigen::Vector2f &o, const Eigen::Vector2f &a,
                        const Eigen::Vector2f &b) {
    return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
  };

  std::vector<Eigen::Vector2f> hull(2 * pts.size());
  size_t h = 0;
  for (size_t i = 0; i < pts.size(); ++i) {
    while (h >= 2 && cross(hull[h - 2], hull[h - 1], pts[i]) <= 0.0f) {
      --h;
    }
    hull[h++] = pts[i];
  }
  for (size_t i = pts.size() - 1, lower = h + 1; i-- > 0;) {
    while (h >= lower && cross(hull[h - 2], hull[h - 1], pts[i]) <= 0.0f) {
      --h;
    }
    hull[h++] = pts[i];
  }
  hull.resize(h > 0 ? h - 1 : 0);

  for (size_t i = 0; i < hull.size(); ++i) {
    const Eigen::Vector2f &a = hull[i];
    const Eigen::Vector2f &b = hull[(i + 1) % hull.size()];
    if (cross(a, b, p) < -tol * std::max(1.0f, (b - a).norm())) {
      return false;
    }
  }
  return true;
}

} // namespace swne::test_support

#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <nanoflann.hpp>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/core/parallel.hpp>
#include <swne/data/graph.hpp>

namespace swne::ops::graph {

using data::GraphEdge;
using data::SimilarityGraph;

/// \brief Shared-nearest-neighbour construction parameters.
struct SnnOptions {
  /// \brief Neighbours per point, the point itself included.
  int k = 20;
  /// \brief Jaccard overlaps below this are dropped.
  float prune = 1.0f / 15.0f;
};

/// \brief nanoflann adaptor over the columns of a `dims x n` matrix.
struct ColumnCloudAdaptor {
  const Eigen::MatrixXf &points;

  [[nodiscard]] size_t kdtree_get_point_count() const {
    return static_cast<size_t>(points.cols());
  }

  [[nodiscard]] float kdtree_get_pt(size_t idx, size_t dim) const {
    return points(static_cast<Eigen::Index>(dim), static_cast<Eigen::Index>(idx));
  }

  template <class BBOX> bool kdtree_get_bbox(BBOX &) const { return false; }
};

/// \brief Dynamic-dimension L2 tree over matrix columns.
using ColumnKDTree = nanoflann::KDTreeSingleIndexAdaptor<
    nanoflann::L2_Simple_Adaptor<float, ColumnCloudAdaptor>, ColumnCloudAdaptor, -1>;

/**
 * \brief Sorted neighbour sets, `k` per query column, flattened row-major.
 *
 * Rows with fewer than `k` hits are padded with `-1`.
 */
inline std::vector<int> knn_sets(const ColumnKDTree &tree, const Eigen::MatrixXf &queries,
                                 int k) {
  const int n = static_cast<int>(queries.cols());
  const size_t stride = static_cast<size_t>(k);
  std::vector<int> sets(static_cast<size_t>(n) * stride, -1);

  core::parallel_for_index(
      0, n,
      [&](int q) {
        thread_local std::vector<uint32_t> ret_index;
        thread_local std::vector<float> out_dist_sqr;
        thread_local std::vector<float> query;
        ret_index.assign(stride, 0u);
        out_dist_sqr.assign(stride, 0.0f);
        query.assign(queries.col(q).data(), queries.col(q).data() + queries.rows());

        const size_t found =
            tree.knnSearch(query.data(), stride, ret_index.data(), out_dist_sqr.data());
        const size_t base = static_cast<size_t>(q) * stride;
        for (size_t i = 0; i < std::min(found, stride); ++i) {
          sets[base + i] = static_cast<int>(ret_index[i]);
        }
        std::sort(sets.begin() + static_cast<std::ptrdiff_t>(base),
                  sets.begin() + static_cast<std::ptrdiff_t>(base + found));
      },
      64);
  return sets;
}

/// \brief Jaccard overlap of two sorted, `-1` padded neighbour sets.
inline float jaccard(const int *a, const int *b, int k) {
  int inter = 0;
  int size_a = 0;
  int size_b = 0;
  int i = 0;
  int j = 0;
  while (i < k && a[i] >= 0 && j < k && b[j] >= 0) {
    if (a[i] == b[j]) {
      ++inter;
      ++i;
      ++j;
    } else if (a[i] < b[j]) {
      ++i;
    } else {
      ++j;
    }
  }
  for (int t = 0; t < k; ++t) {
    size_a += a[t] >= 0 ? 1 : 0;
    size_b += b[t] >= 0 ? 1 : 0;
  }
  const int uni = size_a + size_b - inter;
  return uni > 0 ? static_cast<float>(inter) / static_cast<float>(uni) : 0.0f;
}

inline int clamp_neighbors(const SnnOptions &options, int n_points) {
  if (options.k < 2) {
    fail_config("SNN k must be at least 2, got {}", options.k);
  }
  if (!(options.prune >= 0.0f) || options.prune > 1.0f) {
    fail_config("SNN prune must lie in [0, 1], got {}", options.prune);
  }
  return std::min(options.k, n_points);
}

/**
 * \brief Symmetric SNN graph over the columns of `embedding` (`dims x n`).
 *
 * Every kNN pair is weighted by the Jaccard overlap of the two neighbour
 * sets; pairs below `options.prune` and self pairs are dropped.
 */
inline SimilarityGraph build_snn_graph(const Eigen::MatrixXf &embedding,
                                       const SnnOptions &options = {}) {
  const int n = static_cast<int>(embedding.cols());
  if (n == 0) {
    return SimilarityGraph::sample_graph(0, {});
  }
  const int k = clamp_neighbors(options, n);

  ColumnCloudAdaptor adaptor{embedding};
  ColumnKDTree tree(static_cast<int>(embedding.rows()), adaptor,
                    nanoflann::KDTreeSingleIndexAdaptorParams(32));
  tree.buildIndex();
  const std::vector<int> sets = knn_sets(tree, embedding, k);

  std::vector<GraphEdge> edges;
  edges.reserve(static_cast<size_t>(n) * static_cast<size_t>(k) * 2);
  std::vector<std::pair<int, int>> seen;
  seen.reserve(static_cast<size_t>(n) * static_cast<size_t>(k));
  for (int i = 0; i < n; ++i) {
    const int *row = sets.data() + static_cast<size_t>(i) * static_cast<size_t>(k);
    for (int t = 0; t < k && row[t] >= 0; ++t) {
      if (row[t] != i) {
        seen.emplace_back(std::min(i, row[t]), std::max(i, row[t]));
      }
    }
  }
  std::sort(seen.begin(), seen.end());
  seen.erase(std::unique(seen.begin(), seen.end()), seen.end());

  for (const auto &[a, b] : seen) {
    const float w = jaccard(sets.data() + static_cast<size_t>(a) * static_cast<size_t>(k),
                            sets.data() + static_cast<size_t>(b) * static_cast<size_t>(k), k);
    if (w >= options.prune && w > 0.0f) {
      edges.push_back({a, b, w});
      edges.push_back({b, a, w});
    }
  }

  SimilarityGraph graph = SimilarityGraph::sample_graph(n, std::move(edges));
  core::log_info("SNN", "{} points, k={}, {} edges after pruning at {:.4g}", n, k,
                 graph.num_edges(), options.prune);
  return graph;
}

/**
 * \brief Query-to-training SNN graph (`n_query x n_train`).
 *
 * Each query's kNN set among the training columns is compared with the
 * training point's own kNN set; pruning matches `build_snn_graph`.
 */
inline SimilarityGraph build_projection_graph(const Eigen::MatrixXf &train,
                                              const Eigen::MatrixXf &query,
                                              const SnnOptions &options = {}) {
  if (train.rows() != query.rows()) {
    fail_config("training points have {} dimensions but queries have {}", train.rows(),
                query.rows());
  }
  const int n_train = static_cast<int>(train.cols());
  const int n_query = static_cast<int>(query.cols());
  if (n_train == 0) {
    return SimilarityGraph::bipartite_graph(n_query, 0, {});
  }
  const int k = clamp_neighbors(options, n_train);

  ColumnCloudAdaptor adaptor{train};
  ColumnKDTree tree(static_cast<int>(train.rows()), adaptor,
                    nanoflann::KDTreeSingleIndexAdaptorParams(32));
  tree.buildIndex();
  const std::vector<int> train_sets = knn_sets(tree, train, k);
  const std::vector<int> query_sets = knn_sets(tree, query, k);

  std::vector<GraphEdge> edges;
  for (int q = 0; q < n_query; ++q) {
    const int *row = query_sets.data() + static_cast<size_t>(q) * static_cast<size_t>(k);
    for (int t = 0; t < k && row[t] >= 0; ++t) {
      const int j = row[t];
      const float w =
          jaccard(row, train_sets.data() + static_cast<size_t>(j) * static_cast<size_t>(k), k);
      if (w >= options.prune && w > 0.0f) {
        edges.push_back({q, j, w});
      }
    }
  }

  SimilarityGraph graph = SimilarityGraph::bipartite_graph(n_query, n_train, std::move(edges));
  core::log_info("SNN", "{} queries against {} training points, {} edges", n_query, n_train,
                 graph.num_edges());
  return graph;
}

} // namespace swne::ops::graph

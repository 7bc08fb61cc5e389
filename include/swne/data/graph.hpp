#pragma once

#include <Eigen/Sparse>
#include <algorithm>
#include <cmath>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/data/matrices.hpp>

namespace swne::data {

/// \brief One weighted edge `(row, col, weight)` used to assemble a graph.
struct GraphEdge {
  int row = 0;
  int col = 0;
  float weight = 0.0f;
};

/// \brief Read-only view of one graph row.
struct NeighborRow {
  std::span<const int> cols;
  std::span<const float> weights;

  [[nodiscard]] size_t size() const { return cols.size(); }
  [[nodiscard]] bool empty() const { return cols.empty(); }
};

/**
 * \brief Sparse nonnegative similarity graph in CSR layout.
 *
 * Square graphs connect samples to samples. Rectangular graphs connect
 * query rows to training columns (projection). Column indices within a row
 * are sorted ascending and unique.
 */
struct SimilarityGraph {
  /// \brief CSR row offsets (`rows + 1`).
  std::vector<int> row_offsets;
  /// \brief CSR column indices.
  std::vector<int> col_indices;
  /// \brief CSR edge weights.
  std::vector<float> values;
  /// \brief Column count.
  int n_cols = 0;
  /// \brief Optional row identifiers (empty or one per row).
  IdIndex row_ids;
  /// \brief Optional column identifiers (empty or one per column).
  IdIndex col_ids;

  [[nodiscard]] int rows() const {
    return row_offsets.empty() ? 0 : static_cast<int>(row_offsets.size()) - 1;
  }
  [[nodiscard]] int cols() const { return n_cols; }
  [[nodiscard]] size_t num_edges() const { return col_indices.size(); }
  [[nodiscard]] bool is_square() const { return rows() == n_cols; }

  [[nodiscard]] NeighborRow row(int i) const {
    const int begin = row_offsets[static_cast<size_t>(i)];
    const int end = row_offsets[static_cast<size_t>(i) + 1];
    const size_t count = static_cast<size_t>(end - begin);
    return {std::span<const int>(col_indices.data() + begin, count),
            std::span<const float>(values.data() + begin, count)};
  }

  /// \brief Edge weight `(i, j)` or `0` when absent.
  [[nodiscard]] float weight(int i, int j) const {
    const NeighborRow r = row(i);
    const auto it = std::lower_bound(r.cols.begin(), r.cols.end(), j);
    if (it == r.cols.end() || *it != j) {
      return 0.0f;
    }
    return r.weights[static_cast<size_t>(it - r.cols.begin())];
  }

  /**
   * \brief Assemble from an edge list.
   *
   * Duplicate `(row, col)` entries are summed, zero weights are dropped and,
   * with `drop_diagonal`, self loops are dropped.
   */
  static SimilarityGraph from_edges(int n_rows, int n_cols, std::vector<GraphEdge> edges,
                                    bool drop_diagonal) {
    if (n_rows < 0 || n_cols < 0) {
      fail_config("graph dimensions must be nonnegative ({} x {})", n_rows, n_cols);
    }
    for (const GraphEdge &e : edges) {
      if (e.row < 0 || e.row >= n_rows || e.col < 0 || e.col >= n_cols) {
        fail_config("graph edge ({}, {}) outside {} x {}", e.row, e.col, n_rows, n_cols);
      }
      if (!std::isfinite(e.weight) || e.weight < 0.0f) {
        fail_config("graph edge ({}, {}) has invalid weight {}", e.row, e.col, e.weight);
      }
    }

    std::sort(edges.begin(), edges.end(), [](const GraphEdge &a, const GraphEdge &b) {
      return a.row != b.row ? a.row < b.row : a.col < b.col;
    });

    SimilarityGraph graph;
    graph.n_cols = n_cols;
    graph.row_offsets.assign(static_cast<size_t>(n_rows) + 1, 0);
    graph.col_indices.reserve(edges.size());
    graph.values.reserve(edges.size());

    size_t idx = 0;
    while (idx < edges.size()) {
      const GraphEdge &head = edges[idx];
      float sum = 0.0f;
      size_t next = idx;
      while (next < edges.size() && edges[next].row == head.row && edges[next].col == head.col) {
        sum += edges[next].weight;
        ++next;
      }
      if (sum > 0.0f && !(drop_diagonal && head.row == head.col)) {
        graph.col_indices.push_back(head.col);
        graph.values.push_back(sum);
        graph.row_offsets[static_cast<size_t>(head.row) + 1]++;
      }
      idx = next;
    }

    for (int i = 0; i < n_rows; ++i) {
      graph.row_offsets[static_cast<size_t>(i) + 1] += graph.row_offsets[static_cast<size_t>(i)];
    }
    return graph;
  }

  /// \brief Sample graph (`n x n`) from an edge list; self loops are dropped.
  static SimilarityGraph sample_graph(int n, std::vector<GraphEdge> edges) {
    return from_edges(n, n, std::move(edges), true);
  }

  /// \brief Query-to-training graph; every `(row, col)` pair is kept.
  static SimilarityGraph bipartite_graph(int n_rows, int n_cols, std::vector<GraphEdge> edges) {
    return from_edges(n_rows, n_cols, std::move(edges), false);
  }

  /// \brief Sample graph from a square Eigen sparse matrix (diagonal dropped).
  template <typename Scalar, int Options>
  static SimilarityGraph from_sparse(const Eigen::SparseMatrix<Scalar, Options> &matrix) {
    std::vector<GraphEdge> edges;
    edges.reserve(static_cast<size_t>(matrix.nonZeros()));
    for (int outer = 0; outer < matrix.outerSize(); ++outer) {
      for (typename Eigen::SparseMatrix<Scalar, Options>::InnerIterator it(matrix, outer); it;
           ++it) {
        edges.push_back({static_cast<int>(it.row()), static_cast<int>(it.col()),
                         static_cast<float>(it.value())});
      }
    }
    return from_edges(static_cast<int>(matrix.rows()), static_cast<int>(matrix.cols()),
                      std::move(edges), matrix.rows() == matrix.cols());
  }

  /// \brief Attach identifiers; counts must match the graph shape.
  void set_ids(std::vector<std::string> rows_in, std::vector<std::string> cols_in) {
    if (rows_in.size() != static_cast<size_t>(rows()) ||
        cols_in.size() != static_cast<size_t>(n_cols)) {
      fail_config("graph is {} x {} but got {} row ids and {} column ids", rows(), n_cols,
                  rows_in.size(), cols_in.size());
    }
    row_ids.assign(std::move(rows_in));
    col_ids.assign(std::move(cols_in));
  }

  /// \brief Dense copy, mainly for tests and small diagnostics.
  [[nodiscard]] Eigen::MatrixXf to_dense() const {
    Eigen::MatrixXf dense = Eigen::MatrixXf::Zero(rows(), n_cols);
    for (int i = 0; i < rows(); ++i) {
      const NeighborRow r = row(i);
      for (size_t k = 0; k < r.size(); ++k) {
        dense(i, r.cols[k]) = r.weights[k];
      }
    }
    return dense;
  }

  /**
   * \brief Check the sample-graph invariants.
   *
   * Square shape, empty diagonal, and symmetry within a relative tolerance.
   */
  void validate_sample_graph(float rel_tol = 1e-5f) const {
    if (!is_square()) {
      fail_config("sample graph must be square, got {} x {}", rows(), n_cols);
    }
    for (int i = 0; i < rows(); ++i) {
      const NeighborRow r = row(i);
      for (size_t k = 0; k < r.size(); ++k) {
        const int j = r.cols[k];
        if (j == i) {
          fail_config("sample graph has a self loop at {}", i);
        }
        const float w = r.weights[k];
        const float back = weight(j, i);
        if (std::abs(w - back) > rel_tol * std::max({1.0f, w, back})) {
          fail_config("sample graph is not symmetric at ({}, {}): {} vs {}", i, j, w, back);
        }
      }
    }
  }
};

} // namespace swne::data

#pragma once

#include <Eigen/Dense>
#include <algorithm>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/data/matrices.hpp>
#include <swne/ops/linalg.hpp>

namespace swne::ops::graph {

/**
 * \brief Principal components of the samples (columns) of a features x samples
 *        matrix.
 */
struct PcaModel {
  /// \brief Per-feature mean removed before rotation.
  Eigen::VectorXf center;
  /// \brief Feature loadings of each component (`m x n_pcs`).
  Eigen::MatrixXf rotation;
  /// \brief Sample variance captured by each component.
  Eigen::VectorXf variances;
  /// \brief Component coordinates of the fitted samples (`n_pcs x n`).
  Eigen::MatrixXf embeddings;

  [[nodiscard]] int num_components() const { return static_cast<int>(rotation.cols()); }

  /// \brief Rotate new columns into the fitted component space.
  [[nodiscard]] Eigen::MatrixXf transform(const Eigen::MatrixXf &A) const {
    if (A.rows() != center.size()) {
      fail_config("PCA was fitted on {} features but got {}", center.size(), A.rows());
    }
    return rotation.transpose() * (A.colwise() - center);
  }
};

/**
 * \brief Fit `n_pcs` components to the columns of `A`.
 *
 * Components come from a truncated SVD of the centred matrix, so the
 * covariance is never formed for wide inputs.
 */
inline PcaModel compute_pca(const Eigen::MatrixXf &A, int n_pcs) {
  const int limit = static_cast<int>(std::min(A.rows(), A.cols()));
  if (n_pcs < 1 || n_pcs > limit) {
    fail_config("n_pcs must be in [1, {}], got {}", limit, n_pcs);
  }

  PcaModel model;
  model.center = A.rowwise().mean();
  const Eigen::MatrixXf centred = A.colwise() - model.center;
  const ThinSvd svd = thin_svd(centred, n_pcs);

  model.rotation = svd.U;
  const float dof = static_cast<float>(std::max<Eigen::Index>(1, A.cols() - 1));
  model.variances = svd.S.array().square() / dof;
  model.embeddings = svd.S.asDiagonal() * svd.V.transpose();

  core::log_info("PCA", "{} components of {} samples x {} features, leading variance {:.4g}",
                 n_pcs, A.cols(), A.rows(), model.variances[0]);
  return model;
}

} // namespace swne::ops::graph

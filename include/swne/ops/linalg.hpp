#pragma once

#include <Eigen/Dense>
#include <Spectra/SymEigsSolver.h>
#include <algorithm>
#include <cmath>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>

namespace swne::ops {

/**
 * \brief Spectra operator for `M M^T` (outer) or `M^T M` (inner) without
 *        forming the product.
 */
class GramMatProd {
public:
  using Scalar = float;

  GramMatProd(const Eigen::MatrixXf &m, bool outer) : m_(m), outer_(outer) {}

  [[nodiscard]] int rows() const {
    return static_cast<int>(outer_ ? m_.rows() : m_.cols());
  }
  [[nodiscard]] int cols() const { return rows(); }

  void perform_op(const Scalar *x_in, Scalar *y_out) const {
    Eigen::Map<const Eigen::VectorXf> x(x_in, rows());
    Eigen::Map<Eigen::VectorXf> y(y_out, rows());
    if (outer_) {
      tmp_.noalias() = m_.transpose() * x;
      y.noalias() = m_ * tmp_;
    } else {
      tmp_.noalias() = m_ * x;
      y.noalias() = m_.transpose() * tmp_;
    }
  }

private:
  const Eigen::MatrixXf &m_;
  bool outer_ = true;
  mutable Eigen::VectorXf tmp_;
};

/// \brief Truncated SVD `M ~ U diag(S) V^T`, singular values descending.
struct ThinSvd {
  Eigen::MatrixXf U;
  Eigen::VectorXf S;
  Eigen::MatrixXf V;
};

/// \brief Gram dimension at or below which the dense solver is used directly.
constexpr int kDenseSvdLimit = 64;

/**
 * \brief Leading `rank` singular triplets of `m`.
 *
 * Solves the smaller Gram matrix with Spectra's Lanczos solver and falls
 * back to a dense Eigen solve when the problem is small or Lanczos does not
 * converge. Each left singular vector is signed so its
 * largest-magnitude entry is positive.
 */
inline ThinSvd thin_svd(const Eigen::MatrixXf &m, int rank) {
  const int dim = static_cast<int>(std::min(m.rows(), m.cols()));
  if (rank < 1 || rank > dim) {
    fail_config("requested rank {} for a {} x {} matrix", rank, m.rows(), m.cols());
  }

  const bool outer = m.rows() <= m.cols();
  Eigen::VectorXf values;
  Eigen::MatrixXf vectors;

  const int ncv = std::min(dim, std::max(2 * rank + 1, 20));
  bool solved = false;
  if (dim > kDenseSvdLimit && rank < ncv) {
    GramMatProd op(m, outer);
    Spectra::SymEigsSolver<GramMatProd> eigs(op, rank, ncv);
    eigs.init();
    const int nconv = eigs.compute(Spectra::SortRule::LargestAlge, 1000, 1e-6f);
    if (eigs.info() == Spectra::CompInfo::Successful && nconv >= rank) {
      values = eigs.eigenvalues().head(rank);
      vectors = eigs.eigenvectors(rank);
      solved = true;
    } else {
      core::log_warn("SVD", "Lanczos solve did not converge, using dense eigensolver");
    }
  }

  if (!solved) {
    const Eigen::MatrixXf gram = outer ? Eigen::MatrixXf(m * m.transpose())
                                       : Eigen::MatrixXf(m.transpose() * m);
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXf> dense(gram);
    if (dense.info() != Eigen::Success) {
      fail_config("dense eigensolve failed for a {} x {} Gram matrix", gram.rows(), gram.cols());
    }
    values = dense.eigenvalues().reverse().head(rank);
    vectors = dense.eigenvectors().rowwise().reverse().leftCols(rank);
  }

  ThinSvd svd;
  svd.S = values.cwiseMax(0.0f).cwiseSqrt();
  const Eigen::MatrixXf other = outer ? Eigen::MatrixXf(m.transpose() * vectors)
                                      : Eigen::MatrixXf(m * vectors);
  Eigen::MatrixXf &left = svd.U;
  Eigen::MatrixXf &right = svd.V;
  left = outer ? vectors : other;
  right = outer ? other : vectors;

  // The vectors from `other` still carry the singular value; divide it out.
  Eigen::MatrixXf &scaled = outer ? right : left;
  for (int c = 0; c < rank; ++c) {
    const float s = svd.S[c];
    if (s > 0.0f) {
      scaled.col(c) /= s;
    } else {
      scaled.col(c).setZero();
    }

    Eigen::Index pivot = 0;
    left.col(c).cwiseAbs().maxCoeff(&pivot);
    if (left(pivot, c) < 0.0f) {
      left.col(c) = -left.col(c);
      right.col(c) = -right.col(c);
    }
  }
  return svd;
}

} // namespace swne::ops

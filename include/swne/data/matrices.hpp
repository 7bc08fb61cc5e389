#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>

namespace swne::data {

/**
 * \brief Ordered identifier list with O(1) reverse lookup.
 *
 * Identifiers are unique; `assign` rejects duplicates.
 */
class IdIndex {
public:
  IdIndex() = default;
  explicit IdIndex(std::vector<std::string> ids) { assign(std::move(ids)); }

  void assign(std::vector<std::string> ids) {
    std::unordered_map<std::string, int> lookup;
    lookup.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
      if (!lookup.emplace(ids[i], static_cast<int>(i)).second) {
        fail_config("duplicate identifier '{}'", ids[i]);
      }
    }
    ids_ = std::move(ids);
    lookup_ = std::move(lookup);
  }

  [[nodiscard]] size_t size() const { return ids_.size(); }
  [[nodiscard]] bool empty() const { return ids_.empty(); }
  [[nodiscard]] const std::string &operator[](size_t i) const { return ids_[i]; }
  [[nodiscard]] const std::vector<std::string> &ids() const { return ids_; }

  [[nodiscard]] std::optional<int> find(const std::string &id) const {
    const auto it = lookup_.find(id);
    if (it == lookup_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool operator==(const IdIndex &other) const { return ids_ == other.ids_; }

private:
  std::vector<std::string> ids_;
  std::unordered_map<std::string, int> lookup_;
};

/// \brief Generate `prefix1 .. prefixN` identifiers.
inline std::vector<std::string> sequential_ids(const std::string &prefix, size_t count) {
  std::vector<std::string> ids;
  ids.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    ids.push_back(prefix + std::to_string(i + 1));
  }
  return ids;
}

/// \brief Fail unless every entry of `values` is finite and nonnegative.
inline void require_nonnegative(const Eigen::MatrixXf &values, const char *what) {
  for (int c = 0; c < values.cols(); ++c) {
    for (int r = 0; r < values.rows(); ++r) {
      const float v = values(r, c);
      if (!std::isfinite(v) || v < 0.0f) {
        fail_config("{} entry ({}, {}) = {} is not a finite nonnegative value", what, r, c, v);
      }
    }
  }
}

/**
 * \brief Factor score matrix `H` (k factors x n samples).
 *
 * Column `j` is sample `j`'s loading across factors.
 */
struct FactorScores {
  Eigen::MatrixXf values;
  IdIndex factor_ids;
  IdIndex sample_ids;

  FactorScores() = default;

  /// \brief Wrap `values` with explicit ids (generated when empty).
  FactorScores(Eigen::MatrixXf scores, std::vector<std::string> factors = {},
               std::vector<std::string> samples = {})
      : values(std::move(scores)) {
    if (factors.empty()) {
      factors = sequential_ids("factor_", static_cast<size_t>(values.rows()));
    }
    if (samples.empty()) {
      samples = sequential_ids("sample_", static_cast<size_t>(values.cols()));
    }
    factor_ids.assign(std::move(factors));
    sample_ids.assign(std::move(samples));
  }

  [[nodiscard]] int num_factors() const { return static_cast<int>(values.rows()); }
  [[nodiscard]] int num_samples() const { return static_cast<int>(values.cols()); }

  /// \brief Check id counts against the matrix shape and entries for sign.
  void validate() const {
    if (factor_ids.size() != static_cast<size_t>(values.rows())) {
      fail_config("score matrix has {} factor rows but {} factor ids", values.rows(),
                  factor_ids.size());
    }
    if (sample_ids.size() != static_cast<size_t>(values.cols())) {
      fail_config("score matrix has {} sample columns but {} sample ids", values.cols(),
                  sample_ids.size());
    }
    require_nonnegative(values, "factor score");
  }
};

/**
 * \brief Feature loading matrix `W` (m features x k factors).
 *
 * Row `i` is feature `i`'s loading across factors.
 */
struct FeatureLoadings {
  Eigen::MatrixXf values;
  IdIndex feature_ids;
  IdIndex factor_ids;

  FeatureLoadings() = default;

  FeatureLoadings(Eigen::MatrixXf loadings, std::vector<std::string> features = {},
                  std::vector<std::string> factors = {})
      : values(std::move(loadings)) {
    if (features.empty()) {
      features = sequential_ids("feature_", static_cast<size_t>(values.rows()));
    }
    if (factors.empty()) {
      factors = sequential_ids("factor_", static_cast<size_t>(values.cols()));
    }
    feature_ids.assign(std::move(features));
    factor_ids.assign(std::move(factors));
  }

  [[nodiscard]] int num_features() const { return static_cast<int>(values.rows()); }
  [[nodiscard]] int num_factors() const { return static_cast<int>(values.cols()); }

  void validate() const {
    if (feature_ids.size() != static_cast<size_t>(values.rows())) {
      fail_config("loading matrix has {} feature rows but {} feature ids", values.rows(),
                  feature_ids.size());
    }
    if (factor_ids.size() != static_cast<size_t>(values.cols())) {
      fail_config("loading matrix has {} factor columns but {} factor ids", values.cols(),
                  factor_ids.size());
    }
    require_nonnegative(values, "feature loading");
  }
};

} // namespace swne::data

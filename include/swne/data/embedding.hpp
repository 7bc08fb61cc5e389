#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/data/matrices.hpp>

namespace swne::data {

/// \brief Row-major `n x 2` coordinate block.
using Positions = Eigen::Matrix<float, Eigen::Dynamic, 2, Eigen::RowMajor>;

/// \brief Factor dissimilarity used by the anchor layout.
enum class DistanceMode {
  InformationContent,
  Cosine
};

/// \brief Reduction of the factor dissimilarity matrix to 2D.
enum class ProjectionMethod {
  Pca,
  Sammon
};

inline std::string_view to_string(DistanceMode mode) {
  return mode == DistanceMode::Cosine ? "cosine" : "ic";
}

inline std::string_view to_string(ProjectionMethod method) {
  return method == ProjectionMethod::Pca ? "pca" : "sammon";
}

inline DistanceMode parse_distance_mode(std::string_view text) {
  if (text == "ic") {
    return DistanceMode::InformationContent;
  }
  if (text == "cosine") {
    return DistanceMode::Cosine;
  }
  fail_config("unknown distance mode '{}'", text);
}

inline ProjectionMethod parse_projection_method(std::string_view text) {
  if (text == "pca") {
    return ProjectionMethod::Pca;
  }
  if (text == "sammon") {
    return ProjectionMethod::Sammon;
  }
  fail_config("unknown projection method '{}'", text);
}

/**
 * \brief Identifier-keyed 2D coordinates (anchors, samples or features).
 */
struct CoordinateMap {
  IdIndex ids;
  Positions coords;

  CoordinateMap() = default;
  CoordinateMap(std::vector<std::string> names, Positions points) : coords(std::move(points)) {
    if (names.size() != static_cast<size_t>(coords.rows())) {
      fail_config("coordinate map has {} ids but {} points", names.size(), coords.rows());
    }
    ids.assign(std::move(names));
  }

  [[nodiscard]] int size() const { return static_cast<int>(coords.rows()); }
  [[nodiscard]] bool empty() const { return coords.rows() == 0; }

  [[nodiscard]] Eigen::Vector2f at(int i) const { return coords.row(i).transpose(); }

  [[nodiscard]] std::optional<Eigen::Vector2f> find(const std::string &id) const {
    const auto idx = ids.find(id);
    if (!idx) {
      return std::nullopt;
    }
    return at(*idx);
  }
};

/// \brief Parameters that produced an embedding's anchors and samples.
struct EmbeddingParams {
  float alpha_exp = 1.0f;
  float snn_exp = 1.0f;
  int n_pull = 3;
  DistanceMode distance = DistanceMode::InformationContent;
  ProjectionMethod projection = ProjectionMethod::Sammon;
  uint32_t seed = 42;
};

/// \brief Parameters used for the feature coordinates.
struct FeatureParams {
  int n_pull = 3;
  float alpha_exp = 1.0f;
};

/**
 * \brief Entities that took a degenerate-input fallback.
 *
 * `zero_loading`: all selected loadings were zero (uniform pull used).
 * `isolated`: no graph neighbours (provisional position kept).
 * `unanchored`: projected sample without training edges.
 */
struct Diagnostics {
  std::vector<std::string> zero_loading;
  std::vector<std::string> isolated;
  std::vector<std::string> unanchored;

  [[nodiscard]] bool clean() const {
    return zero_loading.empty() && isolated.empty() && unanchored.empty();
  }
};

/// \brief Anchor, sample and feature layout produced by `ops::embed_swne`.
struct Embedding {
  CoordinateMap anchors;
  CoordinateMap samples;
  CoordinateMap features;
  EmbeddingParams params;
  FeatureParams feature_params;
  Diagnostics diagnostics;
};

/// \brief Parameters for projecting new samples onto an existing layout.
struct ProjectParams {
  int n_pull = 3;
  float alpha_exp = 1.0f;
  float snn_exp = 1.0f;
  /**
   * \brief Treat a new sample with no training edges as a ConfigurationError.
   *
   * Off by default: such a sample keeps its pull-only position and is listed
   * in `Diagnostics::unanchored`.
   */
  bool strict = false;
};

/// \brief Out-of-sample coordinates; never merged into the source embedding.
struct Projection {
  CoordinateMap samples;
  ProjectParams params;
  Diagnostics diagnostics;
};

} // namespace swne::data

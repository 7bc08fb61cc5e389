#pragma once

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>
#include <swne/data/matrices.hpp>
#include <swne/ops/anchor_layout.hpp>
#include <swne/ops/pull.hpp>
#include <swne/ops/smoothing.hpp>

namespace swne::ops {

using data::Embedding;
using data::EmbeddingParams;
using data::FeatureLoadings;
using data::FeatureParams;

/// \brief Ids of the entities whose flag is set.
inline std::vector<std::string> flagged_ids(const data::IdIndex &ids,
                                            const std::vector<uint8_t> &flags) {
  std::vector<std::string> out;
  for (size_t i = 0; i < flags.size(); ++i) {
    if (flags[i] != 0) {
      out.push_back(ids[i]);
    }
  }
  return out;
}

namespace detail {

inline void report_zero_loading(const char *tag, const std::vector<std::string> &ids) {
  if (!ids.empty()) {
    core::log_warn(tag, "{} entities have all-zero top loadings, pulled uniformly: {}",
                   ids.size(), core::preview_ids(ids));
  }
}

inline Embedding embed_impl(const FactorScores &scores, const SimilarityGraph *graph,
                            const EmbeddingParams &params) {
  scores.validate();
  if (scores.num_factors() < 3) {
    fail_config("embedding needs at least 3 factors, got {}", scores.num_factors());
  }
  validate_pull_params(params.n_pull, params.alpha_exp, scores.num_factors());
  if (graph != nullptr) {
    validate_snn_exp(params.snn_exp);
    if (graph->rows() != scores.num_samples()) {
      fail_config("sample graph has {} rows but there are {} samples", graph->rows(),
                  scores.num_samples());
    }
    graph->validate_sample_graph();
    if (!graph->row_ids.empty() && !(graph->row_ids == scores.sample_ids)) {
      fail_config("sample graph ids do not match the score matrix sample ids");
    }
  }

  Embedding embedding;
  embedding.params = params;
  embedding.anchors =
      compute_anchor_layout(scores, params.distance, params.projection, params.seed);

  PullResult pulled =
      pull_entities(ScoreColumns{scores.values}, embedding.anchors, params.n_pull,
                    params.alpha_exp);
  embedding.diagnostics.zero_loading = flagged_ids(scores.sample_ids, pulled.zero_loading);
  report_zero_loading("Pull", embedding.diagnostics.zero_loading);

  Positions final_positions;
  if (graph != nullptr) {
    SmoothingResult smoothed =
        smooth_positions(pulled.positions, *graph, pulled.positions, params.snn_exp);
    embedding.diagnostics.isolated = flagged_ids(scores.sample_ids, smoothed.isolated);
    if (!embedding.diagnostics.isolated.empty()) {
      core::log_warn("Smooth", "{} samples have no graph neighbours, kept factor position: {}",
                     embedding.diagnostics.isolated.size(),
                     core::preview_ids(embedding.diagnostics.isolated));
    }
    final_positions = std::move(smoothed.positions);
  } else {
    final_positions = std::move(pulled.positions);
  }

  embedding.samples = CoordinateMap(scores.sample_ids.ids(), std::move(final_positions));
  core::log_info("Embed", "embedded {} samples on {} anchors (n_pull={}, alpha_exp={}, "
                          "snn_exp={})",
                 scores.num_samples(), scores.num_factors(), params.n_pull, params.alpha_exp,
                 graph != nullptr ? params.snn_exp : 0.0f);
  return embedding;
}

} // namespace detail

/**
 * \brief Compute anchors and smoothed sample coordinates.
 *
 * \param scores Factor scores (`k x n`).
 * \param graph Symmetric sample similarity graph (`n x n`).
 * \param params Pull, smoothing and layout parameters.
 * \throws ConfigurationError on invalid parameters or mismatched inputs.
 */
inline Embedding embed_swne(const FactorScores &scores, const SimilarityGraph &graph,
                            const EmbeddingParams &params) {
  return detail::embed_impl(scores, &graph, params);
}

/// \brief As above without graph smoothing; samples keep their pulled positions.
inline Embedding embed_swne(const FactorScores &scores, const EmbeddingParams &params) {
  return detail::embed_impl(scores, nullptr, params);
}

/**
 * \brief Place a subset of features on an existing layout.
 *
 * Anchors and samples are copied unchanged; feature coordinates are
 * replaced. Features are pulled only, never smoothed.
 * \throws ConfigurationError when a feature id is unknown or the loading
 *         factors do not match the anchors.
 */
inline Embedding embed_features(const Embedding &embedding, const FeatureLoadings &loadings,
                                const std::vector<std::string> &feature_subset,
                                const FeatureParams &params) {
  loadings.validate();
  if (!(loadings.factor_ids == embedding.anchors.ids)) {
    fail_config("loading factors do not match the embedding's anchors ({} vs {} factors)",
                loadings.num_factors(), embedding.anchors.size());
  }

  std::vector<int> rows;
  rows.reserve(feature_subset.size());
  for (const std::string &id : feature_subset) {
    const auto row = loadings.feature_ids.find(id);
    if (!row) {
      fail_config("feature '{}' is not present in the loading matrix", id);
    }
    rows.push_back(*row);
  }

  PullResult pulled = pull_entities(LoadingRows{loadings.values, rows}, embedding.anchors,
                                    params.n_pull, params.alpha_exp);

  Embedding out = embedding;
  out.feature_params = params;
  out.features = CoordinateMap(feature_subset, std::move(pulled.positions));

  std::vector<std::string> zero;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (pulled.zero_loading[i] != 0) {
      zero.push_back(feature_subset[i]);
    }
  }
  detail::report_zero_loading("Pull", zero);

  core::log_info("Embed", "embedded {} features", rows.size());
  return out;
}

/// \brief One feature and its loading on a factor.
struct FeatureScore {
  std::string feature;
  float loading = 0.0f;
};

/// \brief Top features of one factor, strongest first.
struct FactorFeatures {
  std::string factor;
  std::vector<FeatureScore> top;
};

/**
 * \brief Rank features by loading for every factor.
 *
 * Returns up to `features_per_factor` features per factor, ties broken by
 * feature order.
 */
inline std::vector<FactorFeatures> summarize_assoc_features(const FeatureLoadings &loadings,
                                                            int features_per_factor) {
  loadings.validate();
  if (features_per_factor < 1) {
    fail_config("features_per_factor must be positive, got {}", features_per_factor);
  }

  const int m = loadings.num_features();
  const int keep = std::min(features_per_factor, m);
  std::vector<FactorFeatures> summary(static_cast<size_t>(loadings.num_factors()));

  std::vector<int> order(static_cast<size_t>(m));
  for (int f = 0; f < loadings.num_factors(); ++f) {
    std::iota(order.begin(), order.end(), 0);
    std::partial_sort(order.begin(), order.begin() + keep, order.end(), [&](int a, int b) {
      const float la = loadings.values(a, f);
      const float lb = loadings.values(b, f);
      return la != lb ? la > lb : a < b;
    });

    FactorFeatures &entry = summary[static_cast<size_t>(f)];
    entry.factor = loadings.factor_ids[static_cast<size_t>(f)];
    entry.top.reserve(static_cast<size_t>(keep));
    for (int r = 0; r < keep; ++r) {
      const int row = order[static_cast<size_t>(r)];
      entry.top.push_back({loadings.feature_ids[static_cast<size_t>(row)],
                           loadings.values(row, f)});
    }
  }
  return summary;
}

/// \brief Union of the top features of every factor, in first-seen order.
inline std::vector<std::string> top_feature_ids(const std::vector<FactorFeatures> &summary) {
  std::vector<std::string> ids;
  for (const FactorFeatures &entry : summary) {
    for (const FeatureScore &score : entry.top) {
      if (std::find(ids.begin(), ids.end(), score.feature) == ids.end()) {
        ids.push_back(score.feature);
      }
    }
  }
  return ids;
}

} // namespace swne::ops

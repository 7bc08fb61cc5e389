#pragma once

#include <string>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>
#include <swne/data/matrices.hpp>
#include <swne/ops/embed.hpp>
#include <swne/ops/pull.hpp>
#include <swne/ops/smoothing.hpp>

namespace swne::ops {

using data::Projection;
using data::ProjectParams;

/**
 * \brief Training coordinates in the column order of a projection graph.
 *
 * Columns are matched by id when the graph carries column ids, otherwise
 * by position.
 */
inline Positions training_positions_for(const Embedding &embedding,
                                        const SimilarityGraph &graph) {
  const CoordinateMap &train = embedding.samples;
  if (graph.col_ids.empty()) {
    if (graph.cols() != train.size()) {
      fail_config("projection graph has {} columns but the embedding has {} samples",
                  graph.cols(), train.size());
    }
    return train.coords;
  }

  Positions out(graph.cols(), 2);
  for (int j = 0; j < graph.cols(); ++j) {
    const std::string &id = graph.col_ids[static_cast<size_t>(j)];
    const auto idx = train.ids.find(id);
    if (!idx) {
      fail_config("projection graph references unknown training sample '{}'", id);
    }
    out.row(j) = train.coords.row(*idx);
  }
  return out;
}

/**
 * \brief Place new samples on an existing layout.
 *
 * New samples are pulled toward the fixed anchors. A sample with edges into
 * the training graph is then placed at the `snn_exp` weighted mean of its
 * training neighbours' final positions, so a copy of a training sample
 * linked only to that sample lands exactly on it. A sample without edges is
 * unanchored: with `params.strict` this is a ConfigurationError, otherwise
 * its pull-only position is returned and its id is listed in
 * `diagnostics.unanchored`. `embedding` is not modified.
 * \param embedding Source layout (anchors and training samples).
 * \param scores Scores of the new samples over the same factors.
 * \param graph Bipartite graph, new samples (rows) x training samples (cols).
 * \param params Pull and smoothing parameters for the new samples.
 * \throws ConfigurationError on mismatched inputs, unknown training ids, or
 *         (when `params.strict`) a new sample with no training edges.
 */
inline Projection project_samples(const Embedding &embedding, const FactorScores &scores,
                                  const SimilarityGraph &graph, const ProjectParams &params) {
  scores.validate();
  if (!(scores.factor_ids == embedding.anchors.ids)) {
    fail_config("projected scores cover {} factors that do not match the {} anchors",
                scores.num_factors(), embedding.anchors.size());
  }
  validate_pull_params(params.n_pull, params.alpha_exp, scores.num_factors());
  validate_snn_exp(params.snn_exp);
  if (graph.rows() != scores.num_samples()) {
    fail_config("projection graph has {} rows but there are {} new samples", graph.rows(),
                scores.num_samples());
  }
  if (!graph.row_ids.empty() && !(graph.row_ids == scores.sample_ids)) {
    fail_config("projection graph row ids do not match the new sample ids");
  }

  if (params.strict) {
    for (int i = 0; i < graph.rows(); ++i) {
      if (graph.row(i).empty()) {
        fail_config("new sample '{}' has no edges into the training samples",
                    scores.sample_ids[static_cast<size_t>(i)]);
      }
    }
  }

  const Positions train = training_positions_for(embedding, graph);

  PullResult pulled = pull_entities(ScoreColumns{scores.values}, embedding.anchors,
                                    params.n_pull, params.alpha_exp);
  SmoothingResult smoothed =
      smooth_positions(pulled.positions, graph, train, params.snn_exp, SelfTerm::Excluded);

  Projection projection;
  projection.params = params;
  projection.diagnostics.zero_loading = flagged_ids(scores.sample_ids, pulled.zero_loading);
  projection.diagnostics.unanchored = flagged_ids(scores.sample_ids, smoothed.isolated);
  projection.samples = CoordinateMap(scores.sample_ids.ids(), std::move(smoothed.positions));

  detail::report_zero_loading("Project", projection.diagnostics.zero_loading);
  if (!projection.diagnostics.unanchored.empty()) {
    core::log_warn("Project",
                   "{} new samples have no training neighbours, returning factor positions: {}",
                   projection.diagnostics.unanchored.size(),
                   core::preview_ids(projection.diagnostics.unanchored));
  }
  core::log_info("Project", "projected {} samples onto {} anchors", scores.num_samples(),
                 embedding.anchors.size());
  return projection;
}

} // namespace swne::ops

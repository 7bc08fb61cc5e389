#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <swne/swne.hpp>

using namespace swne;

int main(int argc, char **argv) {
  if (argc < 3) {
    fmt::print("Usage: ./swne_embed <matrix.csv> <k> [out_dir] [n_pcs]\n");
    fmt::print("  matrix.csv: features x samples, nonnegative\n");
    return 1;
  }

  try {
    const std::filesystem::path input_path = argv[1];
    const int k = std::stoi(argv[2]);
    const std::filesystem::path out_dir = (argc > 3) ? argv[3] : "swne_output";
    const int requested_pcs = (argc > 4) ? std::stoi(argv[4]) : 20;

    const io::LabeledMatrix input = io::load_matrix_csv(input_path);
    fmt::print("--- SWNE embedding: {} features x {} samples, k={} ---\n", input.values.rows(),
               input.values.cols(), k);

    // 1. Factorization
    ops::factorization::NmfOptions nmf_options;
    nmf_options.k = k;
    const ops::factorization::NmfResult nmf = ops::factorization::run_nmf(input.values, nmf_options);
    const data::FactorScores scores = ops::factorization::to_scores(nmf, input.col_ids);
    const data::FeatureLoadings loadings = ops::factorization::to_loadings(nmf, input.row_ids);

    // 2. Sample graph on principal components
    const int limit = static_cast<int>(std::min(input.values.rows(), input.values.cols()));
    const int n_pcs = std::clamp(requested_pcs, 1, limit);
    const ops::graph::PcaModel pca = ops::graph::compute_pca(input.values, n_pcs);
    data::SimilarityGraph graph = ops::graph::build_snn_graph(pca.embeddings);
    graph.set_ids(input.col_ids, input.col_ids);

    // 3. Layout
    data::Embedding embedding = ops::embed_swne(scores, graph, data::EmbeddingParams{});

    const std::vector<ops::FactorFeatures> summary = ops::summarize_assoc_features(loadings, 1);
    for (const ops::FactorFeatures &entry : summary) {
      fmt::print("  {:<12} top feature {} ({:.4g})\n", entry.factor, entry.top.front().feature,
                 entry.top.front().loading);
    }
    embedding = ops::embed_features(embedding, loadings, ops::top_feature_ids(summary),
                                    data::FeatureParams{});

    // 4. Export
    io::save_embedding(embedding, out_dir);
    io::write_matrix_csv(out_dir / "scores.csv", scores.values, scores.factor_ids.ids(),
                         scores.sample_ids.ids());
    io::write_matrix_csv(out_dir / "loadings.csv", loadings.values, loadings.feature_ids.ids(),
                         loadings.factor_ids.ids());

    if (!embedding.diagnostics.clean()) {
      fmt::print("  -> {} zero-loading, {} isolated samples\n",
                 embedding.diagnostics.zero_loading.size(), embedding.diagnostics.isolated.size());
    }
    fmt::print("  -> Wrote embedding to '{}'\n", out_dir.string());
  } catch (const std::exception &e) {
    fmt::print(stderr, "swne_embed: {}\n", e.what());
    return 1;
  }
  return 0;
}

#include <algorithm>
#include <exception>
#include <filesystem>
#include <string>

#include <fmt/core.h>
#include <swne/swne.hpp>

using namespace swne;

int main(int argc, char **argv) {
  if (argc < 4) {
    fmt::print("Usage: ./swne_project <train.csv> <query.csv> <k> [out_dir] [n_pcs]\n");
    fmt::print("  Both matrices are features x samples with the same feature rows.\n");
    return 1;
  }

  try {
    const std::filesystem::path train_path = argv[1];
    const std::filesystem::path query_path = argv[2];
    const int k = std::stoi(argv[3]);
    const std::filesystem::path out_dir = (argc > 4) ? argv[4] : "swne_projection";
    const int requested_pcs = (argc > 5) ? std::stoi(argv[5]) : 20;

    const io::LabeledMatrix train = io::load_matrix_csv(train_path);
    const io::LabeledMatrix query = io::load_matrix_csv(query_path);
    if (train.row_ids != query.row_ids) {
      fmt::print(stderr, "swne_project: query features do not match the training features\n");
      return 1;
    }

    // --- Training layout ---
    fmt::print("--- Training layout: {} samples, k={} ---\n", train.values.cols(), k);
    ops::factorization::NmfOptions nmf_options;
    nmf_options.k = k;
    const ops::factorization::NmfResult nmf =
        ops::factorization::run_nmf(train.values, nmf_options);
    const data::FactorScores scores = ops::factorization::to_scores(nmf, train.col_ids);

    const int limit = static_cast<int>(std::min(train.values.rows(), train.values.cols()));
    const int n_pcs = std::clamp(requested_pcs, 1, limit);
    const ops::graph::PcaModel pca = ops::graph::compute_pca(train.values, n_pcs);
    data::SimilarityGraph graph = ops::graph::build_snn_graph(pca.embeddings);
    graph.set_ids(train.col_ids, train.col_ids);
    const data::Embedding embedding = ops::embed_swne(scores, graph, data::EmbeddingParams{});

    // --- Projection ---
    fmt::print("\n--- Projecting {} new samples ---\n", query.values.cols());
    const data::FactorScores new_scores(
        ops::factorization::project_scores(nmf.W, query.values), scores.factor_ids.ids(),
        query.col_ids);
    data::SimilarityGraph bridge =
        ops::graph::build_projection_graph(pca.embeddings, pca.transform(query.values));
    bridge.set_ids(query.col_ids, train.col_ids);
    const data::Projection projection =
        ops::project_samples(embedding, new_scores, bridge, data::ProjectParams{});

    io::save_embedding(embedding, out_dir);
    io::write_coordinates_csv(out_dir / "projected.csv", projection.samples);
    if (!projection.diagnostics.unanchored.empty()) {
      fmt::print("  -> {} samples had no training neighbours\n",
                 projection.diagnostics.unanchored.size());
    }
    fmt::print("  -> Wrote projection to '{}'\n", out_dir.string());
  } catch (const std::exception &e) {
    fmt::print(stderr, "swne_project: {}\n", e.what());
    return 1;
  }
  return 0;
}

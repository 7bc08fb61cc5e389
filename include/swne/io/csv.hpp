#pragma once

#include <Eigen/Dense>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>
#include <swne/data/matrices.hpp>

namespace swne::io {

using data::CoordinateMap;
using data::Embedding;
using data::Positions;
using data::SimilarityGraph;

/// \brief Dense matrix with row and column identifiers.
struct LabeledMatrix {
  Eigen::MatrixXf values;
  std::vector<std::string> row_ids;
  std::vector<std::string> col_ids;
};

namespace detail {

inline std::vector<std::string> split_csv_line(const std::string &line) {
  std::vector<std::string> cells;
  std::string cell;
  std::istringstream iss(line);
  while (std::getline(iss, cell, ',')) {
    if (!cell.empty() && cell.back() == '\r') {
      cell.pop_back();
    }
    cells.push_back(cell);
  }
  if (!line.empty() && line.back() == ',') {
    cells.emplace_back();
  }
  return cells;
}

inline float parse_float(const std::string &cell, const std::filesystem::path &path,
                         size_t line_no) {
  const char *begin = cell.c_str();
  char *end = nullptr;
  errno = 0;
  const float value = std::strtof(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE) {
    throw std::runtime_error(
        fmt::format("{}:{}: '{}' is not a number", path.string(), line_no, cell));
  }
  return value;
}

inline std::ifstream open_input(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("File not found: " + path.string());
  }
  return file;
}

inline std::ofstream open_output(const std::filesystem::path &path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write: " + path.string());
  }
  return file;
}

} // namespace detail

/**
 * \brief Read a labelled dense matrix.
 *
 * The first row holds column ids (its first cell is ignored) and the first
 * column holds row ids.
 * \throws std::runtime_error on an unreadable file, ragged rows or
 *         non-numeric cells.
 */
inline LabeledMatrix load_matrix_csv(const std::filesystem::path &path) {
  std::ifstream file = detail::open_input(path);

  std::string line;
  if (!std::getline(file, line)) {
    throw std::runtime_error("Empty matrix file: " + path.string());
  }
  std::vector<std::string> header = detail::split_csv_line(line);
  if (header.empty()) {
    throw std::runtime_error("Missing header: " + path.string());
  }

  LabeledMatrix out;
  out.col_ids.assign(header.begin() + 1, header.end());
  const size_t n_cols = out.col_ids.size();

  std::vector<float> flat;
  size_t line_no = 1;
  while (std::getline(file, line)) {
    ++line_no;
    if (line.empty() || line == "\r") {
      continue;
    }
    const std::vector<std::string> cells = detail::split_csv_line(line);
    if (cells.size() != n_cols + 1) {
      throw std::runtime_error(fmt::format("{}:{}: expected {} cells, got {}", path.string(),
                                           line_no, n_cols + 1, cells.size()));
    }
    out.row_ids.push_back(cells[0]);
    for (size_t c = 1; c < cells.size(); ++c) {
      flat.push_back(detail::parse_float(cells[c], path, line_no));
    }
  }

  const Eigen::Index rows = static_cast<Eigen::Index>(out.row_ids.size());
  const Eigen::Index cols = static_cast<Eigen::Index>(n_cols);
  out.values = Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic,
                                              Eigen::RowMajor>>(flat.data(), rows, cols);

  core::log_info("IO", "Loaded {} ({} x {})", path.filename().string(), rows, cols);
  return out;
}

/// \brief Write a labelled dense matrix in the `load_matrix_csv` layout.
inline void write_matrix_csv(const std::filesystem::path &path, const Eigen::MatrixXf &values,
                             const std::vector<std::string> &row_ids,
                             const std::vector<std::string> &col_ids) {
  if (row_ids.size() != static_cast<size_t>(values.rows()) ||
      col_ids.size() != static_cast<size_t>(values.cols())) {
    fail_config("matrix is {} x {} but got {} row ids and {} column ids", values.rows(),
                values.cols(), row_ids.size(), col_ids.size());
  }

  std::ofstream file = detail::open_output(path);
  file << "id";
  for (const std::string &id : col_ids) {
    file << ',' << id;
  }
  file << '\n';
  for (Eigen::Index r = 0; r < values.rows(); ++r) {
    file << row_ids[static_cast<size_t>(r)];
    for (Eigen::Index c = 0; c < values.cols(); ++c) {
      file << fmt::format(",{:.9g}", values(r, c));
    }
    file << '\n';
  }
  core::log_info("IO", "Exported {}", path.filename().string());
}

/// \brief Write `id,x,y` rows.
inline void write_coordinates_csv(const std::filesystem::path &path, const CoordinateMap &map) {
  std::ofstream file = detail::open_output(path);
  file << "id,x,y\n";
  for (int i = 0; i < map.size(); ++i) {
    file << fmt::format("{},{:.9g},{:.9g}\n", map.ids[static_cast<size_t>(i)], map.coords(i, 0),
                        map.coords(i, 1));
  }
  core::log_info("IO", "Exported {} ({} points)", path.filename().string(), map.size());
}

/// \brief Read `id,x,y` rows written by `write_coordinates_csv`.
inline CoordinateMap load_coordinates_csv(const std::filesystem::path &path) {
  LabeledMatrix raw = load_matrix_csv(path);
  if (raw.col_ids.size() != 2) {
    throw std::runtime_error(fmt::format("{}: expected x,y columns, got {}", path.string(),
                                         raw.col_ids.size()));
  }
  Positions coords = raw.values;
  return CoordinateMap(std::move(raw.row_ids), std::move(coords));
}

/**
 * \brief Persist an embedding as `anchors.csv`, `samples.csv`,
 *        `features.csv` (when present) and `params.txt`.
 */
inline void save_embedding(const Embedding &embedding, const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("Cannot create {}: {}", dir.string(), ec.message()));
  }

  write_coordinates_csv(dir / "anchors.csv", embedding.anchors);
  write_coordinates_csv(dir / "samples.csv", embedding.samples);
  if (!embedding.features.empty()) {
    write_coordinates_csv(dir / "features.csv", embedding.features);
  }

  std::ofstream params = detail::open_output(dir / "params.txt");
  const data::EmbeddingParams &p = embedding.params;
  params << fmt::format("alpha_exp={:.9g}\n", p.alpha_exp);
  params << fmt::format("snn_exp={:.9g}\n", p.snn_exp);
  params << fmt::format("n_pull={}\n", p.n_pull);
  params << fmt::format("distance={}\n", data::to_string(p.distance));
  params << fmt::format("projection={}\n", data::to_string(p.projection));
  params << fmt::format("seed={}\n", p.seed);
  params << fmt::format("feature_n_pull={}\n", embedding.feature_params.n_pull);
  params << fmt::format("feature_alpha_exp={:.9g}\n", embedding.feature_params.alpha_exp);
}

/**
 * \brief Read back a directory written by `save_embedding`.
 *
 * Diagnostics are not persisted and come back empty.
 */
inline Embedding load_embedding(const std::filesystem::path &dir) {
  Embedding embedding;
  embedding.anchors = load_coordinates_csv(dir / "anchors.csv");
  embedding.samples = load_coordinates_csv(dir / "samples.csv");
  if (std::filesystem::exists(dir / "features.csv")) {
    embedding.features = load_coordinates_csv(dir / "features.csv");
  }

  const std::filesystem::path params_path = dir / "params.txt";
  std::ifstream file = detail::open_input(params_path);
  std::unordered_map<std::string, std::string> kv;
  std::string line;
  while (std::getline(file, line)) {
    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    kv[line.substr(0, eq)] = line.substr(eq + 1);
  }

  const auto get = [&](const std::string &key) -> const std::string & {
    const auto it = kv.find(key);
    if (it == kv.end()) {
      throw std::runtime_error(fmt::format("{}: missing '{}'", params_path.string(), key));
    }
    return it->second;
  };
  const auto get_float = [&](const std::string &key) {
    return detail::parse_float(get(key), params_path, 0);
  };
  const auto get_int = [&](const std::string &key) {
    return static_cast<int>(detail::parse_float(get(key), params_path, 0));
  };

  data::EmbeddingParams &p = embedding.params;
  p.alpha_exp = get_float("alpha_exp");
  p.snn_exp = get_float("snn_exp");
  p.n_pull = get_int("n_pull");
  p.distance = data::parse_distance_mode(get("distance"));
  p.projection = data::parse_projection_method(get("projection"));
  p.seed = static_cast<uint32_t>(std::stoul(get("seed")));
  embedding.feature_params.n_pull = get_int("feature_n_pull");
  embedding.feature_params.alpha_exp = get_float("feature_alpha_exp");

  core::log_info("IO", "Loaded embedding from {} ({} anchors, {} samples, {} features)",
                 dir.string(), embedding.anchors.size(), embedding.samples.size(),
                 embedding.features.size());
  return embedding;
}

/**
 * \brief Read a `source,target,weight` edge list (header row required).
 *
 * Sources resolve against `row_ids` and targets against `col_ids`. When both
 * lists are identical the result is a sample graph: self loops are dropped
 * and an edge listed in one direction only is mirrored.
 * \throws std::runtime_error on unreadable or malformed files.
 * \throws ConfigurationError when an edge names an unknown id.
 */
inline SimilarityGraph load_graph_csv(const std::filesystem::path &path,
                                      const std::vector<std::string> &row_ids,
                                      const std::vector<std::string> &col_ids) {
  const data::IdIndex rows(row_ids);
  const data::IdIndex cols(col_ids);
  const bool square = row_ids == col_ids;

  std::ifstream file = detail::open_input(path);
  std::string line;
  if (!std::getline(file, line)) {
    throw std::runtime_error("Empty graph file: " + path.string());
  }

  std::map<std::pair<int, int>, float> weights;
  size_t line_no = 1;
  while (std::getline(file, line)) {
    ++line_no;
    if (line.empty() || line == "\r") {
      continue;
    }
    const std::vector<std::string> cells = detail::split_csv_line(line);
    if (cells.size() != 3) {
      throw std::runtime_error(fmt::format("{}:{}: expected source,target,weight",
                                           path.string(), line_no));
    }
    const auto r = rows.find(cells[0]);
    const auto c = cols.find(cells[1]);
    if (!r || !c) {
      fail_config("{}:{}: edge {} -> {} references an unknown id", path.string(), line_no,
                  cells[0], cells[1]);
    }
    weights[{*r, *c}] += detail::parse_float(cells[2], path, line_no);
  }

  std::vector<data::GraphEdge> edges;
  edges.reserve(weights.size() * (square ? 2 : 1));
  for (const auto &[key, w] : weights) {
    edges.push_back({key.first, key.second, w});
    if (square && weights.find({key.second, key.first}) == weights.end()) {
      edges.push_back({key.second, key.first, w});
    }
  }

  const int n_rows = static_cast<int>(row_ids.size());
  const int n_cols = static_cast<int>(col_ids.size());
  SimilarityGraph graph = square ? SimilarityGraph::sample_graph(n_rows, std::move(edges))
                                 : SimilarityGraph::bipartite_graph(n_rows, n_cols,
                                                                    std::move(edges));
  graph.set_ids(row_ids, col_ids);
  core::log_info("IO", "Loaded graph {} ({} x {}, {} edges)", path.filename().string(), n_rows,
                 n_cols, graph.num_edges());
  return graph;
}

} // namespace swne::io

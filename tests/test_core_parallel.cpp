#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <swne/core/error.hpp>
#include <swne/core/parallel.hpp>
#include <swne/ops/embed.hpp>

#include "support/synthetic_data.hpp"
#include "support/test_env.hpp"

TEST_CASE("backend and thread count follow the environment") {
  setenv("SWNE_BACKEND", "CPU", 1);
  CHECK(swne::core::compute_backend_from_env() == swne::core::ComputeBackend::Serial);
  setenv("SWNE_BACKEND", "parallel", 1);
  CHECK(swne::core::compute_backend_from_env() == swne::core::ComputeBackend::Parallel);

  setenv("SWNE_NUM_THREADS", "3", 1);
  CHECK(swne::core::compute_thread_count() == 3);
  setenv("SWNE_NUM_THREADS", "zero", 1);
  CHECK(swne::core::compute_thread_count() == swne::core::hardware_thread_count());

  swne::test_support::configure_deterministic_test_env();
  CHECK(swne::core::compute_backend_from_env() == swne::core::ComputeBackend::Serial);
}

TEST_CASE("parallel_for_index visits every index exactly once") {
  swne::test_support::configure_deterministic_test_env();
  setenv("SWNE_BACKEND", "parallel", 1);
  setenv("SWNE_NUM_THREADS", "4", 1);

  std::vector<std::atomic<int>> hits(1000);
  for (int round = 0; round < 3; ++round) {
    swne::core::parallel_for_index(0, 1000, [&](int i) { hits[static_cast<size_t>(i)]++; }, 16);
  }
  for (const auto &h : hits) {
    CHECK(h.load() == 3);
  }

  swne::core::parallel_for_index(5, 5, [&](int) { FAIL("empty range ran"); });
  swne::test_support::configure_deterministic_test_env();
}

TEST_CASE("exceptions thrown on worker threads reach the caller") {
  swne::test_support::configure_deterministic_test_env();
  setenv("SWNE_BACKEND", "parallel", 1);
  setenv("SWNE_NUM_THREADS", "4", 1);

  // Index 900 falls in the last block, which runs on a helper thread.
  std::vector<std::atomic<int>> hits(1000);
  CHECK_THROWS_AS(swne::core::parallel_for_index(
                      0, 1000,
                      [&](int i) {
                        if (i == 900) {
                          swne::fail_config("bad entity {}", i);
                        }
                        hits[static_cast<size_t>(i)]++;
                      },
                      16),
                  swne::ConfigurationError);
  // Other blocks still ran to completion before the rethrow.
  CHECK(hits[0].load() == 1);
  CHECK(hits[499].load() == 1);
  CHECK(hits[900].load() == 0);

  CHECK_THROWS_WITH_AS(
      swne::core::parallel_for_index(
          0, 1000, [](int i) { if (i % 250 == 10) throw std::runtime_error(std::to_string(i)); },
          16),
      "10", std::runtime_error);

  swne::test_support::configure_deterministic_test_env();
  CHECK_THROWS_AS(swne::core::parallel_for_index(
                      0, 10, [](int) { throw std::runtime_error("serial"); }),
                  std::runtime_error);
}

TEST_CASE("nested parallel loops complete") {
  swne::test_support::configure_deterministic_test_env();
  setenv("SWNE_BACKEND", "parallel", 1);
  setenv("SWNE_NUM_THREADS", "3", 1);

  std::vector<std::atomic<int>> hits(64 * 64);
  swne::core::parallel_for_index(
      0, 64,
      [&](int outer) {
        swne::core::parallel_for_index(
            0, 64, [&](int inner) { hits[static_cast<size_t>(outer * 64 + inner)]++; }, 8);
      },
      8);
  for (const auto &h : hits) {
    CHECK(h.load() == 1);
  }
  swne::test_support::configure_deterministic_test_env();
}

TEST_CASE("embedding is identical for serial and threaded execution") {
  swne::test_support::configure_deterministic_test_env();
  const auto scores = swne::test_support::make_cluster_scores(6, 40);
  const auto graph = swne::test_support::make_chain_graph(scores.num_samples(), 0.7f);

  const auto serial = swne::ops::embed_swne(scores, graph, swne::data::EmbeddingParams{});

  setenv("SWNE_BACKEND", "parallel", 1);
  setenv("SWNE_NUM_THREADS", "4", 1);
  const auto threaded = swne::ops::embed_swne(scores, graph, swne::data::EmbeddingParams{});
  swne::test_support::configure_deterministic_test_env();

  CHECK(serial.anchors.coords == threaded.anchors.coords);
  CHECK(serial.samples.coords == threaded.samples.coords);
}

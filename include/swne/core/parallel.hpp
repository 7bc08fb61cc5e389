#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace swne::core {

/// \brief Runtime execution backend for per-entity loops.
enum class ComputeBackend {
  Serial,
  Parallel
};

/**
 * \brief Parse the execution backend from `SWNE_BACKEND`.
 *
 * `cpu` and `serial` select single-threaded execution; anything else (or an
 * unset variable) selects threaded execution.
 * \return Selected backend.
 */
inline ComputeBackend compute_backend_from_env() {
  const char *raw = std::getenv("SWNE_BACKEND");
  if (raw == nullptr) {
    return ComputeBackend::Parallel;
  }

  std::string value(raw);
  for (char &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (value == "cpu" || value == "serial") {
    return ComputeBackend::Serial;
  }
  return ComputeBackend::Parallel;
}

/**
 * \brief Hardware concurrency with a floor of `1`.
 * \return Hardware thread count.
 */
inline int hardware_thread_count() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

/**
 * \brief Worker count requested through `SWNE_NUM_THREADS`.
 * \return Requested count, or the hardware count when unset or invalid.
 */
inline int compute_thread_count() {
  const char *raw = std::getenv("SWNE_NUM_THREADS");
  if (raw != nullptr) {
    const int requested = std::atoi(raw);
    if (requested > 0) {
      return requested;
    }
  }
  return hardware_thread_count();
}

/**
 * \brief Run `fn(i)` for every `i` in `[begin, end)`, possibly in parallel.
 *
 * The range is cut into one contiguous block per participant and the calling
 * thread takes the first block. Every index is visited exactly once, so
 * loops that write one output slot per index need no locking. Ranges shorter
 * than `min_parallel_range` and the serial backend run inline.
 *
 * If `fn` throws, the remaining indices of that block are skipped, all
 * participants are joined, and the exception from the lowest block is
 * rethrown on the calling thread.
 */
template <typename Fn>
void parallel_for_index(int begin, int end, Fn &&fn, int min_parallel_range = 64) {
  if (end <= begin) {
    return;
  }

  const int total = end - begin;
  const int requested =
      compute_backend_from_env() == ComputeBackend::Serial ? 1 : compute_thread_count();
  const int participants = std::min(requested, total);
  if (participants <= 1 || total < min_parallel_range) {
    for (int i = begin; i < end; ++i) {
      fn(i);
    }
    return;
  }

  std::vector<std::exception_ptr> errors(static_cast<size_t>(participants));
  const auto run_block = [&](int block) {
    const int first = begin + static_cast<int>(static_cast<int64_t>(total) * block / participants);
    const int last =
        begin + static_cast<int>(static_cast<int64_t>(total) * (block + 1) / participants);
    try {
      for (int i = first; i < last; ++i) {
        fn(i);
      }
    } catch (...) {
      errors[static_cast<size_t>(block)] = std::current_exception();
    }
  };

  std::vector<std::thread> helpers;
  helpers.reserve(static_cast<size_t>(participants - 1));
  int spawned = 1;
  try {
    for (; spawned < participants; ++spawned) {
      helpers.emplace_back(run_block, spawned);
    }
  } catch (const std::system_error &) {
    // Out of threads: the caller finishes the unstarted blocks itself.
  }
  run_block(0);
  for (int block = spawned; block < participants; ++block) {
    run_block(block);
  }
  for (auto &thread : helpers) {
    thread.join();
  }

  for (const std::exception_ptr &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

} // namespace swne::core

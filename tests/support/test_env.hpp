#pragma once

#include <cstdlib>

namespace swne::test_support {

inline void configure_deterministic_test_env() {
  setenv("SWNE_BACKEND", "cpu", 1);
  setenv("SWNE_NUM_THREADS", "1", 1);
  setenv("SWNE_QUIET", "1", 1);
}

} // namespace swne::test_support

#pragma once

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace swne::core {

/// \brief Console verbosity derived from `SWNE_QUIET`.
enum class LogLevel {
  Info,
  Warn,
  Silent
};

/**
 * \brief Parse verbosity from `SWNE_QUIET`.
 *
 * Unset prints everything; `all` silences warnings too; any other value keeps
 * warnings only.
 */
inline LogLevel log_level_from_env() {
  const char *raw = std::getenv("SWNE_QUIET");
  if (raw == nullptr) {
    return LogLevel::Info;
  }
  if (std::strcmp(raw, "all") == 0) {
    return LogLevel::Silent;
  }
  return LogLevel::Warn;
}

/// \brief Print `[tag] message` to stdout unless quiet.
template <typename... Args>
void log_info(std::string_view tag, fmt::format_string<Args...> format, Args &&...args) {
  if (log_level_from_env() != LogLevel::Info) {
    return;
  }
  fmt::print(stdout, "[{}] {}\n", tag, fmt::format(format, std::forward<Args>(args)...));
}

/// \brief Print `[tag] warning: message` to stderr unless fully silenced.
template <typename... Args>
void log_warn(std::string_view tag, fmt::format_string<Args...> format, Args &&...args) {
  if (log_level_from_env() == LogLevel::Silent) {
    return;
  }
  fmt::print(stderr, "[{}] warning: {}\n", tag,
             fmt::format(format, std::forward<Args>(args)...));
}

/**
 * \brief Join the first `limit` ids for a log line, appending `...` when cut.
 * \param ids Identifiers to list.
 * \param limit Maximum number printed.
 */
inline std::string preview_ids(std::span<const std::string> ids, size_t limit = 5) {
  std::string out;
  const size_t shown = std::min(ids.size(), limit);
  for (size_t i = 0; i < shown; ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += ids[i];
  }
  if (ids.size() > shown) {
    out += ", ...";
  }
  return out;
}

} // namespace swne::core

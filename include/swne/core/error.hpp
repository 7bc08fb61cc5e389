#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace swne {

/**
 * \brief Invalid parameters, mismatched shapes or unknown identifiers.
 *
 * Raised before any output is produced; no partial results escape.
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

/// \brief Throw `ConfigurationError` with a `{fmt}` message.
template <typename... Args>
[[noreturn]] void fail_config(fmt::format_string<Args...> format, Args &&...args) {
  throw ConfigurationError(fmt::format(format, std::forward<Args>(args)...));
}

} // namespace swne

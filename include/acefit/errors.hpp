#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by every acefit component.
 *
 * All failures inside the library surface as exceptions derived from
 * @c acefit::Error.  Two refinements exist:
 *
 * - @c ShapeError: stored data or a basis evaluation does not have the
 *   layout the row assembly expects.  Accepting such data would misalign
 *   the design matrix, so it is always fatal for the current call.
 * - @c ConfigError: a fit settings document is malformed.  It carries the
 *   breadcrumb of the offending entry (e.g. @c weights.crystal.E).
 *
 * Exceptions thrown by user supplied capabilities (basis evaluation,
 * reference energies, solvers) are never wrapped; they propagate as-is.
 *
 * @ingroup acefit_cpp
 */

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace acefit {

/**
 * @class Error
 * @brief Base exception for acefit.
 * @ingroup acefit_cpp
 */
class Error : public std::runtime_error {
public:
  /**
   * @brief Construct from a human readable message.
   * @param msg Description of the failure.
   */
  explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

/**
 * @class ShapeError
 * @brief Stored or evaluated data has an unexpected type or shape.
 * @ingroup acefit_cpp
 */
class ShapeError : public Error {
public:
  using Error::Error;
};

/**
 * @class ConfigError
 * @brief A settings document could not be interpreted.
 * @ingroup acefit_cpp
 */
class ConfigError : public Error {
public:
  /**
   * @brief Construct with the location of the offending entry.
   * @param path Dotted path of the entry, empty for the document root.
   * @param msg  Description of the problem.
   */
  ConfigError(std::string path, const std::string &msg)
      : Error(path.empty() ? msg : path + ": " + msg), path_(std::move(path)) {}

  /**
   * @brief Dotted path of the entry that failed validation.
   * @return The breadcrumb, possibly empty.
   */
  const std::string &path() const noexcept { return path_; }

private:
  std::string path_; //!< Breadcrumb into the settings document.
};

namespace details {

/**
 * @brief Throw a @c ShapeError unless @a ok holds.
 *
 * The message is only formatted on failure.
 *
 * @param ok     Condition that must be true.
 * @param format fmt format string of the message.
 * @param args   Format arguments.
 */
template <typename... Args>
inline void require_shape(bool ok, fmt::format_string<Args...> format,
                          Args &&...args) {
  if (!ok) {
    throw ShapeError(fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace details
} // namespace acefit

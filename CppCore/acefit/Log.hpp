#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Minimal leveled logging on top of the @c fmt library.
 *
 * Messages are written to stderr with an @c [acefit:level] prefix.  The
 * threshold is process wide and defaults to @c Level::Info; callers silence
 * the library with @c set_level(Level::Off).
 */

#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace acefit {
namespace log {

/**
 * @brief Severity of a log message.
 */
enum class Level {
  Debug = 0, //!< Detailed tracing of assembly steps.
  Info,      //!< Progress of the fitting pipeline.
  Warn,      //!< Recoverable oddities in input data or settings.
  Error,     //!< Failures that are about to be reported to the caller.
  Off        //!< Suppress everything.
};

/**
 * @brief Sets the global threshold.
 * @param lvl Messages below this level are dropped.
 * @return Void.
 */
void set_level(Level lvl);

/**
 * @brief Fetches the global threshold.
 * @return The current level.
 */
Level level();

/**
 * @brief Whether a message at @a lvl would be emitted.
 * @param lvl The level to test.
 * @return True when @a lvl is at or above the threshold.
 */
bool enabled(Level lvl);

/**
 * @brief Writes a preformatted message.
 * @param lvl Severity.
 * @param message Message body without trailing newline.
 * @return Void.
 */
void write(Level lvl, std::string_view message);

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Debug)) {
    write(Level::Debug, fmt::format(f, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Info)) {
    write(Level::Info, fmt::format(f, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Warn)) {
    write(Level::Warn, fmt::format(f, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Error)) {
    write(Level::Error, fmt::format(f, std::forward<Args>(args)...));
  }
}

} // namespace log
} // namespace acefit

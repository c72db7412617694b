// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of the stderr log sink.
 */

#include "acefit/Log.hpp"

#include <atomic>
#include <cstdio>

namespace acefit {
namespace log {

namespace {
std::atomic<Level> g_level{Level::Info};

const char *label(Level lvl) {
  switch (lvl) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  case Level::Off:
    break;
  }
  return "off";
}
} // namespace

void set_level(Level lvl) { g_level.store(lvl); }

Level level() { return g_level.load(); }

bool enabled(Level lvl) {
  return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

/**
 * @details
 * Multi-line messages (tables) are emitted with the prefix on the first line
 * only, so rendered reports stay aligned.
 */
void write(Level lvl, std::string_view message) {
  fmt::print(stderr, "[acefit:{}] {}\n", label(lvl), message);
  std::fflush(stderr);
}

} // namespace log
} // namespace acefit

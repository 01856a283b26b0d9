#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>
#include "util/CppUtil.hpp"

// The logging macros are LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN(), and LOG_ERROR().
//
// LOG_INFO("Training step {}/{}", step, num_steps);
//
// LOG_TRACE() and LOG_DEBUG() statements are compiled out unless SPDLOG_ACTIVE_LEVEL is lowered.
// Configure with -DBZERO_DEBUG_LOGGING=ON to do so.

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Throws util::CleanException if params.log_level is not a recognized level name.
  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"

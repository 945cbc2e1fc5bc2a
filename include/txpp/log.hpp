// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Log -- library logger on top of spdlog.
//
// Design:
//   - One named logger ("txpp"), created lazily on first use
//   - Level from TXPP_LOG_LEVEL, pattern from TXPP_LOG_PATTERN
//   - SetLogger() lets the application route txpp output into its own sinks;
//     call it before the first transaction is opened

#pragma once

#include <cstdlib>
#include <cstring>
#include <memory>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace txpp {

namespace detail {

/// spdlog level for `name`; unknown or empty names fall back to warn.
inline spdlog::level::level_enum ParseLogLevel(const char* name) {
  if (name == nullptr || name[0] == '\0') { return spdlog::level::warn; }
  spdlog::level::level_enum level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && std::strcmp(name, "off") != 0) {
    return spdlog::level::warn;
  }
  return level;
}

inline spdlog::level::level_enum ResolveLogLevel() {
  return ParseLogLevel(std::getenv("TXPP_LOG_LEVEL"));
}

inline const char* ResolveLogPattern() {
  const char* pattern = std::getenv("TXPP_LOG_PATTERN");
  if (pattern != nullptr && pattern[0] != '\0') { return pattern; }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %n: %v";
}

inline std::shared_ptr<spdlog::logger> MakeDefaultLogger() {
  std::shared_ptr<spdlog::logger> logger = spdlog::get("txpp");
  if (logger == nullptr) {
    logger = spdlog::stderr_color_mt("txpp");
  }
  logger->set_level(ResolveLogLevel());
  logger->set_pattern(ResolveLogPattern());
  return logger;
}

inline std::shared_ptr<spdlog::logger>& LoggerSlot() {
  static std::shared_ptr<spdlog::logger> slot = MakeDefaultLogger();
  return slot;
}

}  // namespace detail

inline spdlog::logger& Log() { return *detail::LoggerSlot(); }

inline void SetLogger(std::shared_ptr<spdlog::logger> logger) {
  if (logger != nullptr) { detail::LoggerSlot() = std::move(logger); }
}

}  // namespace txpp

#pragma once

#include <spdlog/spdlog.h>

#include <format>

// Messages are formatted with std::format so that std::formatter specializations (Kind, Node, Hexdump) work in
// log lines; the formatting is skipped entirely when the level is disabled.
#define GPK_LOG(lvl, ...)                                                \
  do {                                                                   \
    if (::spdlog::should_log(lvl)) {                                     \
      ::spdlog::log(lvl, "{}", std::format(__VA_ARGS__));                \
    }                                                                    \
  } while (0)

#define TRACE(...) GPK_LOG(::spdlog::level::trace, __VA_ARGS__)
#define DEBUG(...) GPK_LOG(::spdlog::level::debug, __VA_ARGS__)
#define INFO(...) GPK_LOG(::spdlog::level::info, __VA_ARGS__)
#define WARN(...) GPK_LOG(::spdlog::level::warn, __VA_ARGS__)
#define ERROR(...) GPK_LOG(::spdlog::level::err, __VA_ARGS__)

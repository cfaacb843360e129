#pragma once

#include <format>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>

namespace gpk {

inline std::string to_string(const std::source_location& l) {
  return std::format("{}:{} `{}`: ", l.file_name(), l.line(), l.function_name());
}

[[noreturn]] inline void die(std::string why) { throw std::runtime_error(why); }

}  // namespace gpk

#define die(fmt, ...) \
  gpk::die(gpk::to_string(std::source_location::current()) + std::format(fmt __VA_OPT__(, ) __VA_ARGS__))

namespace gpk {

[[noreturn]] inline void unreachable() { __builtin_unreachable(); }

}  // namespace gpk

#pragma once

#include <cstddef>

namespace gpk::literal {

constexpr std::size_t operator""_KB(unsigned long long n) { return n * 1024; }
constexpr std::size_t operator""_MB(unsigned long long n) { return n * 1024 * 1024; }

}  // namespace gpk::literal

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iomanip>
#include <ostream>
#include <span>
#include <sstream>
#include <string>

namespace gpk {

inline constexpr char hex_lookup[] = "0123456789ABCDEF";

template <size_t RowSize = 16, bool ShowAscii = true>
struct CustomHexdump {
  explicit CustomHexdump(std::span<const std::byte> s_) : s(s_) {}
  CustomHexdump(const void *data, size_t length) : s(reinterpret_cast<const std::byte *>(data), length) {}
  std::span<const std::byte> s;
};

using Hexdump = CustomHexdump<16, true>;

template <size_t RowSize, bool ShowAscii>
std::string to_string(const CustomHexdump<RowSize, ShowAscii> &dump) {
  std::stringstream out;
  auto &s = dump.s;
  out.fill('0');
  out << std::dec << s.size() << " bytes\n";
  for (auto i = 0uz; i < s.size(); i += RowSize) {
    out << std::setw(8) << std::hex << i << ": ";
    for (auto j = 0uz; j < RowSize; ++j) {
      if (i + j < s.size()) {
        auto c = std::to_integer<uint8_t>(s[i + j]);
        out << hex_lookup[c >> 4] << hex_lookup[c & 0xF] << ' ';
      } else {
        out << "   ";
      }
    }
    if (ShowAscii) {
      out << ' ';
      for (auto j = 0uz; j < RowSize && i + j < s.size(); ++j) {
        auto c = std::to_integer<uint8_t>(s[i + j]);
        out << (std::isprint(c) ? static_cast<char>(c) : '.');
      }
    }
    if (i + RowSize < s.size()) {
      out << '\n';
    }
  }
  return out.str();
}

}  // namespace gpk

template <size_t RowSize, bool ShowAscii>
std::ostream &operator<<(std::ostream &out, const gpk::CustomHexdump<RowSize, ShowAscii> &dump) {
  return out << gpk::to_string(dump);
}

template <size_t RowSize, bool ShowAscii>
struct std::formatter<gpk::CustomHexdump<RowSize, ShowAscii>> : std::formatter<std::string> {
  template <typename Context>
  Context::iterator format(const gpk::CustomHexdump<RowSize, ShowAscii> &dump, Context &ctx) const {
    return std::formatter<std::string>::format(gpk::to_string(dump), ctx);
  }
};

#include "codec/utf.hxx"

#include <simdutf.h>

#include "util/logger.hxx"

namespace gpk::codec {

std::optional<std::string> to_utf8(std::string_view s) {
  if (!simdutf::validate_utf8(s.data(), s.size())) {
    TRACE("ill-formed utf-8 input of {} bytes", s.size());
    return std::nullopt;
  }
  return std::string(s);
}

std::optional<std::string> to_utf8(std::u8string_view s) {
  return to_utf8(std::string_view(reinterpret_cast<const char *>(s.data()), s.size()));
}

std::optional<std::string> to_utf8(std::u16string_view s) {
  if (s.empty()) {
    return std::string();
  }
  std::string out(simdutf::utf8_length_from_utf16(s.data(), s.size()), '\0');
  auto n = simdutf::convert_utf16_to_utf8(s.data(), s.size(), out.data());
  if (n == 0) {
    TRACE("ill-formed utf-16 input of {} units", s.size());
    return std::nullopt;
  }
  out.resize(n);
  return out;
}

std::optional<std::string> to_utf8(std::u32string_view s) {
  if (s.empty()) {
    return std::string();
  }
  std::string out(simdutf::utf8_length_from_utf32(s.data(), s.size()), '\0');
  auto n = simdutf::convert_utf32_to_utf8(s.data(), s.size(), out.data());
  if (n == 0) {
    TRACE("ill-formed utf-32 input of {} units", s.size());
    return std::nullopt;
  }
  out.resize(n);
  return out;
}

std::optional<std::string> to_utf8(std::wstring_view s) {
  if constexpr (sizeof(wchar_t) == sizeof(char32_t)) {
    return to_utf8(std::u32string_view(reinterpret_cast<const char32_t *>(s.data()), s.size()));
  } else {
    return to_utf8(std::u16string_view(reinterpret_cast<const char16_t *>(s.data()), s.size()));
  }
}

std::optional<std::string> to_utf8(char32_t c) { return to_utf8(std::u32string_view(&c, 1)); }

}  // namespace gpk::codec

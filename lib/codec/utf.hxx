#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace gpk::codec {

// Transcoding to UTF-8 from native-endian code units. nullopt when the input is not well-formed; narrow strings
// are taken as UTF-8 and validated.
std::optional<std::string> to_utf8(std::string_view s);
std::optional<std::string> to_utf8(std::u8string_view s);
std::optional<std::string> to_utf8(std::u16string_view s);
std::optional<std::string> to_utf8(std::u32string_view s);
std::optional<std::string> to_utf8(std::wstring_view s);
std::optional<std::string> to_utf8(char32_t c);

}  // namespace gpk::codec

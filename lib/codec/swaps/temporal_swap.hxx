#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec/swap.hxx"
#include "util/enum_formatter.hxx"

namespace gpk::codec {

// ISO-8601 and RFC 1123 renderings of a point in time, in UTC.
enum class TemporalFormat : uint8_t {
  BasicIsoDate,      // 20120304Z
  IsoDate,           // 2012-03-04Z
  IsoDateTime,       // 2012-03-04T05:06:07Z
  IsoInstant,        // 2012-03-04T05:06:07Z, fractional seconds when present
  IsoLocalDate,      // 2012-03-04
  IsoLocalDateTime,  // 2012-03-04T05:06:07
  IsoLocalTime,      // 05:06:07
  Rfc1123DateTime,   // Sun, 4 Mar 2012 05:06:07 GMT
};

// accepts the DateTimeFormatter style names, e.g. "ISO_INSTANT"
std::optional<TemporalFormat> parse_temporal_format(std::string_view name);

class TemporalSwap final : public StringSwap<std::chrono::system_clock::time_point> {
 public:
  explicit TemporalSwap(TemporalFormat f_) : f(f_) {}

  TemporalFormat format() const { return f; }

  std::string format(std::chrono::system_clock::time_point tp) const;

 protected:
  std::string to(const std::chrono::system_clock::time_point &tp) const override { return format(tp); }

 private:
  TemporalFormat f;
};

}  // namespace gpk::codec

// clang-format off
EnumFormatter(gpk::codec::TemporalFormat,
    "BASIC_ISO_DATE", "ISO_DATE", "ISO_DATE_TIME", "ISO_INSTANT",
    "ISO_LOCAL_DATE", "ISO_LOCAL_DATE_TIME", "ISO_LOCAL_TIME", "RFC_1123_DATE_TIME");
// clang-format on

#include "codec/swaps/temporal_swap.hxx"

#include <array>
#include <format>

#include "util/fatal.hxx"

namespace gpk::codec {

namespace {

constexpr std::array<std::string_view, 8> format_names = {
    "BASIC_ISO_DATE", "ISO_DATE",       "ISO_DATE_TIME",  "ISO_INSTANT",
    "ISO_LOCAL_DATE", "ISO_LOCAL_DATE_TIME", "ISO_LOCAL_TIME", "RFC_1123_DATE_TIME",
};

}  // namespace

std::optional<TemporalFormat> parse_temporal_format(std::string_view name) {
  for (auto i = 0uz; i < format_names.size(); ++i) {
    if (format_names[i] == name) {
      return static_cast<TemporalFormat>(i);
    }
  }
  return std::nullopt;
}

std::string TemporalSwap::format(std::chrono::system_clock::time_point tp) const {
  using namespace std::chrono;
  auto s = floor<seconds>(tp);
  switch (f) {
    case TemporalFormat::BasicIsoDate:
      return std::format("{:%Y%m%d}Z", s);
    case TemporalFormat::IsoDate:
      return std::format("{:%Y-%m-%d}Z", s);
    case TemporalFormat::IsoDateTime:
      return std::format("{:%Y-%m-%dT%H:%M:%S}Z", s);
    case TemporalFormat::IsoInstant: {
      auto ms = floor<milliseconds>(tp);
      if (ms == s) {
        return std::format("{:%Y-%m-%dT%H:%M:%S}Z", s);
      }
      return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms);
    }
    case TemporalFormat::IsoLocalDate:
      return std::format("{:%Y-%m-%d}", s);
    case TemporalFormat::IsoLocalDateTime:
      return std::format("{:%Y-%m-%dT%H:%M:%S}", s);
    case TemporalFormat::IsoLocalTime:
      return std::format("{:%H:%M:%S}", s);
    case TemporalFormat::Rfc1123DateTime: {
      year_month_day ymd{floor<days>(s)};
      return std::format("{:%a}, {} {:%b %Y %H:%M:%S} GMT", s, static_cast<unsigned>(ymd.day()), s);
    }
  }
  unreachable();
}

}  // namespace gpk::codec

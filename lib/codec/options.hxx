#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "codec/swaps/temporal_swap.hxx"
#include "codec/uri.hxx"
#include "util/enum_formatter.hxx"
#include "util/literal.hxx"

using namespace gpk::literal;

namespace gpk::codec {

enum class BinaryFormat : uint8_t {
  Binary,
  Hex,
  SpacedHex,
  Base64,
};

struct Options {
  size_t max_depth = 100;
  bool keep_null_properties = false;
  bool sort_maps = false;
  bool sort_collections = false;
  bool trim_strings = false;
  bool add_bean_types = false;
  bool add_root_type = false;
  std::string bean_type_property_name = "_type";
  size_t buffer_size = 64_KB;
  // "binary", "hex", "spaced-hex" or "base64"
  std::string binary_format = "binary";
  // name of a TemporalFormat applied to time points, e.g. "ISO_INSTANT"; empty leaves them to registered swaps
  std::string date_format;
  UriContext uri_context;
  // "absolute", "root-relative" or "none"
  std::string uri_resolution = "none";
  // "resource" or "path-info"
  std::string uri_relativity = "resource";

  // dies on a value out of range
  void validate() const;

  BinaryFormat format() const;
  UriResolution resolution() const;
  UriRelativity relativity() const;
  std::optional<TemporalFormat> temporal_format() const;

  // nullopt when the document does not parse; unknown keys are rejected
  static std::optional<Options> from_json(std::string_view json);
  std::string to_json(bool prettify = false) const;
};

}  // namespace gpk::codec

EnumFormatter(gpk::codec::BinaryFormat, "binary", "hex", "spaced-hex", "base64");

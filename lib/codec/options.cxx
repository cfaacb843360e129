#include "codec/options.hxx"

#include <glaze/glaze.hpp>

#include "util/fatal.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

BinaryFormat Options::format() const {
  if (binary_format == "binary") {
    return BinaryFormat::Binary;
  } else if (binary_format == "hex") {
    return BinaryFormat::Hex;
  } else if (binary_format == "spaced-hex") {
    return BinaryFormat::SpacedHex;
  } else if (binary_format == "base64") {
    return BinaryFormat::Base64;
  }
  die("Unknown binary format: {}", binary_format);
}

UriResolution Options::resolution() const {
  if (uri_resolution == "absolute") {
    return UriResolution::Absolute;
  } else if (uri_resolution == "root-relative") {
    return UriResolution::RootRelative;
  } else if (uri_resolution == "none") {
    return UriResolution::None;
  }
  die("Unknown uri resolution: {}", uri_resolution);
}

UriRelativity Options::relativity() const {
  if (uri_relativity == "resource") {
    return UriRelativity::Resource;
  } else if (uri_relativity == "path-info") {
    return UriRelativity::PathInfo;
  }
  die("Unknown uri relativity: {}", uri_relativity);
}

std::optional<TemporalFormat> Options::temporal_format() const {
  if (date_format.empty()) {
    return std::nullopt;
  }
  if (auto f = parse_temporal_format(date_format); f.has_value()) {
    return f;
  }
  die("Unknown date format: {}", date_format);
}

void Options::validate() const {
  if (max_depth == 0) {
    die("Max depth must be positive");
  }
  if (buffer_size < 16) {
    die("Buffer size {} is too small", buffer_size);
  }
  if (bean_type_property_name.empty()) {
    die("Bean type property name must not be empty");
  }
  format();
  resolution();
  relativity();
  temporal_format();
  if (resolution() == UriResolution::Absolute && uri_context.authority.empty()) {
    WARN("Absolute uri resolution without authority, uris stay root-relative");
  }
}

std::optional<Options> Options::from_json(std::string_view json) {
  Options o;
  if (auto ec = glz::read_json(o, json); ec) {
    ERROR("Fail to parse options: {}", glz::format_error(ec, json));
    return std::nullopt;
  }
  return o;
}

std::string Options::to_json(bool prettify) const {
  if (prettify) {
    return glz::write<glz::opts{.prettify = true}>(*this).value_or("Corrupted option");
  }
  return glz::write_json(*this).value_or("Corrupted option");
}

}  // namespace gpk::codec

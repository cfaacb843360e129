#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "util/enum_formatter.hxx"

namespace gpk::codec {

// A string value that is resolved against the URI context before it is written.
struct Uri {
  std::string value;

  bool operator==(const Uri &) const = default;
};

struct UriContext {
  std::string authority;     // e.g. "http://localhost:8080"
  std::string context_root;  // e.g. "/app"
  std::string servlet_path;  // e.g. "/resource"
  std::string path_info;     // e.g. "/foo"
};

enum class UriResolution : uint8_t {
  Absolute,
  RootRelative,
  None,
};

enum class UriRelativity : uint8_t {
  Resource,
  PathInfo,
};

class UriResolver {
 public:
  virtual ~UriResolver() = default;
  virtual std::string resolve(std::string_view uri) const = 0;
};

// Resolves "context:/", "servlet:/", "request:/", root-relative and relative URIs against a UriContext.
class ContextUriResolver : public UriResolver {
 public:
  ContextUriResolver(UriContext context_, UriResolution resolution_, UriRelativity relativity_)
      : c(std::move(context_)), resolution(resolution_), relativity(relativity_) {}
  ~ContextUriResolver() override = default;

  std::string resolve(std::string_view uri) const override;

 private:
  std::string base(UriRelativity r) const;

  UriContext c;
  UriResolution resolution;
  UriRelativity relativity;
};

bool has_scheme(std::string_view uri);

// collapses "." and ".." segments and duplicate slashes of a path
std::string normalize_path(std::string_view path);

}  // namespace gpk::codec

// clang-format off
EnumFormatter(gpk::codec::UriResolution, "Absolute", "RootRelative", "None");
EnumFormatter(gpk::codec::UriRelativity, "Resource", "PathInfo");
// clang-format on

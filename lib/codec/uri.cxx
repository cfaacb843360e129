#include "codec/uri.hxx"

#include <cctype>
#include <vector>

namespace gpk::codec {

namespace {

constexpr std::string_view context_prefix = "context:";
constexpr std::string_view servlet_prefix = "servlet:";
constexpr std::string_view request_prefix = "request:";

std::string join(std::string_view base, std::string_view rest) {
  std::string result(base);
  result += '/';
  result += rest;
  return result;
}

}  // namespace

bool has_scheme(std::string_view uri) {
  if (uri.empty() || !std::isalpha(static_cast<unsigned char>(uri[0]))) {
    return false;
  }
  for (auto i = 1uz; i < uri.size(); ++i) {
    auto c = static_cast<unsigned char>(uri[i]);
    if (c == ':') {
      return true;
    }
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return false;
}

std::string normalize_path(std::string_view path) {
  std::vector<std::string_view> segments;
  size_t pos = 0;
  while (pos <= path.size()) {
    auto next = path.find('/', pos);
    if (next == std::string_view::npos) {
      next = path.size();
    }
    auto segment = path.substr(pos, next - pos);
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    pos = next + 1;
  }
  std::string result;
  for (auto segment : segments) {
    result += '/';
    result += segment;
  }
  if (result.empty() || (path.ends_with('/') && !segments.empty())) {
    result += '/';
  }
  return result;
}

std::string ContextUriResolver::base(UriRelativity r) const {
  auto b = c.context_root + c.servlet_path;
  if (r == UriRelativity::PathInfo) {
    b += c.path_info;
  }
  return b;
}

std::string ContextUriResolver::resolve(std::string_view uri) const {
  if (resolution == UriResolution::None) {
    return std::string(uri);
  }
  std::string path;
  if (uri.starts_with(context_prefix)) {
    path = join(c.context_root, uri.substr(context_prefix.size()));
  } else if (uri.starts_with(servlet_prefix)) {
    path = join(c.context_root + c.servlet_path, uri.substr(servlet_prefix.size()));
  } else if (uri.starts_with(request_prefix)) {
    path = join(base(UriRelativity::PathInfo), uri.substr(request_prefix.size()));
  } else if (has_scheme(uri)) {
    return std::string(uri);
  } else if (uri.starts_with('/')) {
    path = uri;
  } else {
    path = join(base(relativity), uri);
  }

  // query and fragment are kept verbatim
  std::string tail;
  if (auto q = path.find_first_of("?#"); q != std::string::npos) {
    tail = path.substr(q);
    path.resize(q);
  }
  auto result = normalize_path(path) + tail;
  if (resolution == UriResolution::Absolute) {
    std::string_view authority = c.authority;
    while (authority.ends_with('/')) {
      authority.remove_suffix(1);
    }
    result.insert(0, authority);
  }
  return result;
}

}  // namespace gpk::codec

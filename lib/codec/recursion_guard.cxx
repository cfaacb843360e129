#include "codec/recursion_guard.hxx"

#include <format>

#include "codec/errors.hxx"
#include "codec/type_info.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

namespace {

// anonymous entries (collection elements, map values) are named by their type
std::string label(std::string_view attr, const TypeDescriptor &type) {
  return attr.empty() ? std::format("<{}>", type.name()) : std::string(attr);
}

}  // namespace

std::optional<RecursionGuard::Frame> RecursionGuard::enter(std::string_view attr, const Value &v) {
  if (v.is_null() || !is_recursion_candidate(v.type().category())) {
    return Frame(nullptr);
  }
  if (on_path.contains(v.identity())) {
    TRACE("Recursion on {} of {} at {}", attr, v.type().name(), path());
    return std::nullopt;
  }
  if (stack.size() >= max_depth) {
    auto p = path();
    if (!p.empty()) {
      p += '/';
    }
    throw DepthExceededError(max_depth, p + label(attr, v.type()));
  }
  stack.push_back({std::string(attr), v.identity(), &v.type()});
  on_path.insert(v.identity());
  return Frame(this);
}

bool RecursionGuard::would_recurse(const Value &v) const {
  if (v.is_null() || !is_recursion_candidate(v.type().category())) {
    return false;
  }
  return on_path.contains(v.identity());
}

std::string RecursionGuard::path() const {
  std::string p;
  for (auto &e : stack) {
    if (!p.empty()) {
      p += '/';
    }
    p += label(e.attr, *e.type);
  }
  return p;
}

void RecursionGuard::exit() {
  if (stack.empty()) {
    ERROR("Exit on an empty path");
    return;
  }
  on_path.erase(stack.back().id);
  stack.pop_back();
}

}  // namespace gpk::codec

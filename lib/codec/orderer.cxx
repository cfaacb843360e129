#include "codec/orderer.hxx"

#include <algorithm>
#include <compare>
#include <string>
#include <utility>
#include <variant>

namespace gpk::codec {

namespace {

int rank(const Value &v) {
  if (v.is_null() || v.type().is_null(v.object())) {
    return 0;
  }
  switch (v.type().category()) {
    case Category::Boolean:
      return 1;
    case Category::Integer:
    case Category::Float:
      return 2;
    case Category::String:
    case Category::Char:
    case Category::Uri:
      return 3;
    default:
      return 4;
  }
}

template <typename T>
int sign(T a, T b) {
  return a < b ? -1 : (b < a ? 1 : 0);
}

int compare_numbers(const Number &a, const Number &b) {
  return std::visit(
      [](auto x, auto y) -> int {
        using X = decltype(x);
        using Y = decltype(y);
        if constexpr (std::is_integral_v<X> && std::is_integral_v<Y>) {
          return std::cmp_less(x, y) ? -1 : (std::cmp_less(y, x) ? 1 : 0);
        } else {
          auto o = std::strong_order(static_cast<double>(x), static_cast<double>(y));
          return o < 0 ? -1 : (o > 0 ? 1 : 0);
        }
      },
      a, b);
}

std::string text_of(const Value &v) {
  if (auto s = v.type().to_string(v.object()); s.has_value()) {
    return std::move(s).value();
  }
  return v.type().name();
}

}  // namespace

int natural_compare(const Value &x, const Value &y) {
  auto d = &descriptor_of<Value>();
  auto a = resolve(x, d);
  auto b = resolve(y, d);
  auto ra = rank(a), rb = rank(b);
  if (ra != rb) {
    return sign(ra, rb);
  }
  switch (ra) {
    case 0:
      return 0;
    case 1:
      return sign(a.type().as_bool(a.object()), b.type().as_bool(b.object()));
    case 2:
      return compare_numbers(a.type().as_number(a.object()), b.type().as_number(b.object()));
    default: {
      auto c = text_of(a).compare(text_of(b));
      return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
  }
}

bool natural_less(const Value &a, const Value &b) { return natural_compare(a, b) < 0; }

std::vector<std::pair<Value, Value>> CollectionOrderer::entries(const Value &map) const {
  auto r = map.type().entries(map.object());
  for (auto &[k, v] : r) {
    k.keep_alive(map);
    v.keep_alive(map);
  }
  if (sort_maps) {
    std::ranges::stable_sort(r, [this](const auto &a, const auto &b) { return less(a.first, b.first); });
  }
  return r;
}

std::vector<Value> CollectionOrderer::elements(const Value &c) const {
  auto r = c.type().elements(c.object());
  for (auto &e : r) {
    e.keep_alive(c);
  }
  if (sort_collections) {
    std::ranges::stable_sort(r, less);
  }
  return r;
}

}  // namespace gpk::codec

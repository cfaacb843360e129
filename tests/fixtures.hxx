#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "codec/bean.hxx"
#include "codec/serializer.hxx"
#include "codec/sink.hxx"
#include "codec/type_info.hxx"

namespace gpk::codec::testing {

// "82 A1 61"
inline std::string spaced_hex(std::span<const std::byte> bytes) {
  StringSink s;
  HexSink h(s, true);
  h.write(bytes);
  return s.take();
}

template <typename T>
std::string encode_hex(const T &root, Options o = {}) {
  Serializer s(std::move(o));
  return spaced_hex(s.serialize_to_bytes(root));
}

struct Pair {
  int64_t a = 1;
  std::string b = "foo";
};

struct Person : PropertyEnumerable {
  std::string name;
  Person *next = nullptr;

  explicit Person(std::string name_) : name(std::move(name_)) {}

  void properties(PropertyList &l) const override { l.add("name", name).add("next", next); }
};

struct Flaky : PropertyEnumerable {
  void properties(PropertyList &l) const override {
    l.add("a", 1)
        .read("b", []() -> int { throw std::runtime_error("boom"); })
        .add("c", 3);
  }
};

struct Shape : PropertyEnumerable {
  int64_t id = 0;

  void properties(PropertyList &l) const override { l.add("id", id); }
};

struct Circle : Shape {
  int64_t radius = 2;

  void properties(PropertyList &l) const override {
    Shape::properties(l);
    l.add("radius", radius);
  }
  std::string_view type_name() const override { return "circle"; }
};

// next is read through an accessor returning a reference
struct Member : PropertyEnumerable {
  std::string name;
  Member *next = nullptr;

  explicit Member(std::string name_) : name(std::move(name_)) {}

  const Member &successor() const { return *next; }

  void properties(PropertyList &l) const override {
    l.add("name", name).read("next", [this]() -> const Member & { return successor(); });
  }
};

struct Padded : PropertyEnumerable {
  std::string text = " x ";
  void properties(PropertyList &l) const override { l.add(" padded ", text); }
};

struct Canvas : PropertyEnumerable {
  std::shared_ptr<Shape> main = std::make_shared<Circle>();

  void properties(PropertyList &l) const override {
    l.read("main", [this]() -> const Shape & { return *main; });
  }
};

struct Link {
  std::string href;
  std::string title;
};

struct Celsius {
  double degrees;
};

struct Reading {
  Celsius t;
};

// no string form
struct Opaque {
  int x = 0;
};

struct Holder {
  Opaque o;
};

}  // namespace gpk::codec::testing

template <>
struct gpk::codec::BeanTraits<gpk::codec::testing::Pair> {
  static void properties(const gpk::codec::testing::Pair &p, PropertyList &l) { l.add("a", p.a).add("b", p.b); }
  static std::string_view type_name(const gpk::codec::testing::Pair &) { return "pair"; }
};

template <>
struct gpk::codec::BeanTraits<gpk::codec::testing::Link> {
  static void properties(const gpk::codec::testing::Link &l_, PropertyList &l) {
    l.uri("href", l_.href).add("title", l_.title);
  }
};

template <>
struct gpk::codec::BeanTraits<gpk::codec::testing::Holder> {
  static void properties(const gpk::codec::testing::Holder &h, PropertyList &l) { l.add("x", h.o); }
};

template <>
struct gpk::codec::BeanTraits<gpk::codec::testing::Reading> {
  static void properties(const gpk::codec::testing::Reading &r, PropertyList &l) { l.add("t", r.t); }
};

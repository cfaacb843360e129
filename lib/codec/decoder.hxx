#pragma once

#include <zpp_bits.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "util/noncopyable.hxx"

namespace gpk::codec {

struct Node;

using NodeArray = std::vector<Node>;
using NodeMap = std::vector<std::pair<Node, Node>>;
using Binary = std::vector<std::byte>;

// One decoded MessagePack value. Maps keep their entry order.
struct Node {
  std::variant<std::monostate, bool, int64_t, uint64_t, float, double, std::string, Binary, NodeArray, NodeMap> v;

  bool operator==(const Node &) const = default;

  bool is_null() const { return std::holds_alternative<std::monostate>(v); }

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(v);
  }
  template <typename T>
  const T &as() const {
    return std::get<T>(v);
  }

  // value of a string key in a map, nullptr when absent
  const Node *find(std::string_view key) const;
};

class Decoder : Noncopyable, Nonmovable {
  using In = zpp::bits::in<std::span<const std::byte>, zpp::bits::endian::big>;

 public:
  // exactly one value; trailing bytes are an error
  static Node decode(std::span<const std::byte> bytes);
  static Node decode(std::string_view bytes) { return decode(std::as_bytes(std::span(bytes.data(), bytes.size()))); }

 private:
  explicit Decoder(std::span<const std::byte> bytes_)
      : bytes(bytes_), in(std::span<const std::byte>(bytes_), zpp::bits::endian::big{}) {}
  ~Decoder() = default;

  Node parse(size_t depth);
  template <typename T>
  T get();
  std::span<const std::byte> take(size_t n);
  NodeArray parse_array(size_t n, size_t depth);
  NodeMap parse_map(size_t n, size_t depth);

  std::span<const std::byte> bytes;
  In in;
};

std::string to_string(const Node &n);

}  // namespace gpk::codec

template <>
struct std::formatter<gpk::codec::Node> : std::formatter<std::string> {
  template <typename Context>
  Context::iterator format(const gpk::codec::Node &n, Context &ctx) const {
    return std::formatter<std::string>::format(gpk::codec::to_string(n), ctx);
  }
};

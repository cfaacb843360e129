#include "codec/decoder.hxx"

#include <algorithm>

#include "codec/errors.hxx"
#include "util/hex_dump.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

namespace {

constexpr size_t max_nesting = 1024;

}  // namespace

const Node *Node::find(std::string_view key) const {
  if (!is<NodeMap>()) {
    return nullptr;
  }
  for (auto &[k, value] : as<NodeMap>()) {
    if (k.is<std::string>() && k.as<std::string>() == key) {
      return &value;
    }
  }
  return nullptr;
}

Node Decoder::decode(std::span<const std::byte> bytes) {
  Decoder d(bytes);
  auto n = d.parse(0);
  if (d.in.position() != bytes.size()) {
    throw DecodeError(std::format("{} trailing bytes", bytes.size() - d.in.position()), d.in.position());
  }
  TRACE("Decoded {}", n);
  return n;
}

template <typename T>
T Decoder::get() {
  T t{};
  auto off = in.position();
  if (auto ec = in(t); zpp::bits::failure(ec)) {
    throw DecodeError(std::format("truncated input, {} bytes expected", sizeof(T)), off);
  }
  return t;
}

std::span<const std::byte> Decoder::take(size_t n) {
  auto off = in.position();
  if (bytes.size() - off < n) {
    throw DecodeError(std::format("truncated input, {} bytes expected", n), off);
  }
  in.position() += n;
  return bytes.subspan(off, n);
}

NodeArray Decoder::parse_array(size_t n, size_t depth) {
  NodeArray a;
  a.reserve(std::min(n, bytes.size() - in.position()));
  for (auto i = 0uz; i < n; ++i) {
    a.push_back(parse(depth + 1));
  }
  return a;
}

NodeMap Decoder::parse_map(size_t n, size_t depth) {
  NodeMap m;
  m.reserve(std::min(n, bytes.size() - in.position()));
  for (auto i = 0uz; i < n; ++i) {
    auto k = parse(depth + 1);
    auto v = parse(depth + 1);
    m.emplace_back(std::move(k), std::move(v));
  }
  return m;
}

Node Decoder::parse(size_t depth) {
  if (depth > max_nesting) {
    throw DecodeError("nesting too deep", in.position());
  }
  auto off = in.position();
  auto tag = get<uint8_t>();
  if (tag <= 0x7f) {
    return {uint64_t{tag}};
  }
  if (tag >= 0xe0) {
    return {int64_t{static_cast<int8_t>(tag)}};
  }
  if ((tag & 0xf0) == 0x80) {
    return {parse_map(tag & 0x0f, depth)};
  }
  if ((tag & 0xf0) == 0x90) {
    return {parse_array(tag & 0x0f, depth)};
  }
  auto text = [this](size_t n) {
    auto s = take(n);
    return std::string(reinterpret_cast<const char *>(s.data()), s.size());
  };
  auto binary = [this](size_t n) {
    auto s = take(n);
    return Binary(s.begin(), s.end());
  };
  if ((tag & 0xe0) == 0xa0) {
    return {text(tag & 0x1f)};
  }
  switch (tag) {
    case 0xc0:
      return {};
    case 0xc2:
      return {false};
    case 0xc3:
      return {true};
    case 0xc4:
      return {binary(get<uint8_t>())};
    case 0xc5:
      return {binary(get<uint16_t>())};
    case 0xc6:
      return {binary(get<uint32_t>())};
    case 0xca:
      return {get<float>()};
    case 0xcb:
      return {get<double>()};
    case 0xcc:
      return {uint64_t{get<uint8_t>()}};
    case 0xcd:
      return {uint64_t{get<uint16_t>()}};
    case 0xce:
      return {uint64_t{get<uint32_t>()}};
    case 0xcf:
      return {get<uint64_t>()};
    case 0xd0:
      return {int64_t{get<int8_t>()}};
    case 0xd1:
      return {int64_t{get<int16_t>()}};
    case 0xd2:
      return {int64_t{get<int32_t>()}};
    case 0xd3:
      return {get<int64_t>()};
    case 0xd9:
      return {text(get<uint8_t>())};
    case 0xda:
      return {text(get<uint16_t>())};
    case 0xdb:
      return {text(get<uint32_t>())};
    case 0xdc:
      return {parse_array(get<uint16_t>(), depth)};
    case 0xdd:
      return {parse_array(get<uint32_t>(), depth)};
    case 0xde:
      return {parse_map(get<uint16_t>(), depth)};
    case 0xdf:
      return {parse_map(get<uint32_t>(), depth)};
    default:
      throw DecodeError(std::format("unknown tag 0x{:02x}", tag), off);
  }
}

std::string to_string(const Node &n) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return std::format("\"{}\"", v);
        } else if constexpr (std::is_same_v<T, Binary>) {
          std::string s = "<";
          for (auto b : v) {
            auto c = std::to_integer<uint8_t>(b);
            s += hex_lookup[c >> 4];
            s += hex_lookup[c & 0xF];
          }
          return s + ">";
        } else if constexpr (std::is_same_v<T, NodeArray>) {
          std::string s = "[";
          for (auto i = 0uz; i < v.size(); ++i) {
            s += (i == 0 ? "" : ", ") + to_string(v[i]);
          }
          return s + "]";
        } else if constexpr (std::is_same_v<T, NodeMap>) {
          std::string s = "{";
          for (auto i = 0uz; i < v.size(); ++i) {
            s += (i == 0 ? "" : ", ") + to_string(v[i].first) + ": " + to_string(v[i].second);
          }
          return s + "}";
        } else {
          return std::format("{}", v);
        }
      },
      n.v);
}

}  // namespace gpk::codec

#include "codec/encoder.hxx"

#include <array>
#include <limits>
#include <string>

#include "codec/errors.hxx"
#include "codec/utf.hxx"
#include "util/fatal.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

namespace {

constexpr uint8_t NIL = 0xc0;
constexpr uint8_t FALSE = 0xc2;
constexpr uint8_t TRUE = 0xc3;
constexpr uint8_t BIN8 = 0xc4;
constexpr uint8_t BIN16 = 0xc5;
constexpr uint8_t BIN32 = 0xc6;
constexpr uint8_t FLOAT32 = 0xca;
constexpr uint8_t FLOAT64 = 0xcb;
constexpr uint8_t UINT8 = 0xcc;
constexpr uint8_t UINT16 = 0xcd;
constexpr uint8_t UINT32 = 0xce;
constexpr uint8_t UINT64 = 0xcf;
constexpr uint8_t INT8 = 0xd0;
constexpr uint8_t INT16 = 0xd1;
constexpr uint8_t INT32 = 0xd2;
constexpr uint8_t INT64 = 0xd3;
constexpr uint8_t STR8 = 0xd9;
constexpr uint8_t STR16 = 0xda;
constexpr uint8_t STR32 = 0xdb;
constexpr uint8_t ARRAY16 = 0xdc;
constexpr uint8_t ARRAY32 = 0xdd;
constexpr uint8_t MAP16 = 0xde;
constexpr uint8_t MAP32 = 0xdf;
constexpr uint8_t FIXSTR = 0xa0;
constexpr uint8_t FIXARRAY = 0x90;
constexpr uint8_t FIXMAP = 0x80;

// largest header plus payload of a scalar
constexpr size_t max_scalar_size = 9;

constexpr size_t pipe_chunk_size = 8192;

}  // namespace

BinaryEncoder::BinaryEncoder(Sink &sink_, size_t buffer_size)
    : sink(sink_), buffer(buffer_size), out(buffer.borrow(), zpp::bits::endian::big{}) {
  if (buffer_size < max_scalar_size) {
    die("Staging buffer of {} bytes is too small", buffer_size);
  }
}

template <typename... Ts>
void BinaryEncoder::put(const Ts &...vs) {
  ensure((sizeof(Ts) + ...));
  if (auto ec = out(vs...); zpp::bits::failure(ec)) {
    die("Fail to stage {} bytes at {}, error: {}", (sizeof(Ts) + ...), out.position(),
        std::make_error_code(std::errc(ec)).message());
  }
}

void BinaryEncoder::put_raw(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return;
  }
  // a payload larger than the staging buffer bypasses it
  if (bytes.size() > buffer.size()) {
    flush();
    sink.write(bytes);
    flushed += bytes.size();
    return;
  }
  ensure(bytes.size());
  if (auto ec = out(zpp::bits::unsized(bytes)); zpp::bits::failure(ec)) {
    die("Fail to stage {} bytes at {}, error: {}", bytes.size(), out.position(),
        std::make_error_code(std::errc(ec)).message());
  }
}

void BinaryEncoder::ensure(size_t n) {
  if (buffer.size() - out.position() < n) {
    flush();
  }
}

void BinaryEncoder::flush() {
  auto n = out.position();
  if (n == 0) {
    return;
  }
  TRACE("Flush {} staged bytes", n);
  sink.write(buffer.bytes(n));
  flushed += n;
  out.reset();
}

void BinaryEncoder::check_length(size_t n, std::string_view what) const {
  if (n > std::numeric_limits<uint32_t>::max()) {
    throw UnsupportedValueError(std::format("{} of {} exceeds the 32-bit limit", what, n), std::string(what), "");
  }
}

BinaryEncoder &BinaryEncoder::append_null() {
  put(NIL);
  return *this;
}

BinaryEncoder &BinaryEncoder::append_boolean(bool b) {
  put(b ? TRUE : FALSE);
  return *this;
}

BinaryEncoder &BinaryEncoder::append_int(int64_t i) {
  if (i >= 0) {
    return append_uint(static_cast<uint64_t>(i));
  }
  if (i >= -32) {
    put(static_cast<int8_t>(i));
  } else if (i >= std::numeric_limits<int8_t>::min()) {
    put(INT8, static_cast<int8_t>(i));
  } else if (i >= std::numeric_limits<int16_t>::min()) {
    put(INT16, static_cast<int16_t>(i));
  } else if (i >= std::numeric_limits<int32_t>::min()) {
    put(INT32, static_cast<int32_t>(i));
  } else {
    put(INT64, i);
  }
  return *this;
}

BinaryEncoder &BinaryEncoder::append_uint(uint64_t u) {
  if (u < 128) {
    put(static_cast<uint8_t>(u));
  } else if (u <= std::numeric_limits<uint8_t>::max()) {
    put(UINT8, static_cast<uint8_t>(u));
  } else if (u <= std::numeric_limits<uint16_t>::max()) {
    put(UINT16, static_cast<uint16_t>(u));
  } else if (u <= std::numeric_limits<uint32_t>::max()) {
    put(UINT32, static_cast<uint32_t>(u));
  } else {
    put(UINT64, u);
  }
  return *this;
}

BinaryEncoder &BinaryEncoder::append_float(float f) {
  put(FLOAT32, f);
  return *this;
}

BinaryEncoder &BinaryEncoder::append_double(double d) {
  put(FLOAT64, d);
  return *this;
}

BinaryEncoder &BinaryEncoder::append_number(const Number &n) {
  std::visit(
      [this](auto v) {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, int64_t>) {
          append_int(v);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
          append_uint(v);
        } else if constexpr (std::is_same_v<T, float>) {
          append_float(v);
        } else {
          append_double(v);
        }
      },
      n);
  return *this;
}

BinaryEncoder &BinaryEncoder::append_string(std::string_view s) {
  auto n = s.size();
  check_length(n, "string length");
  if (n < 32) {
    put(static_cast<uint8_t>(FIXSTR | n));
  } else if (n <= std::numeric_limits<uint8_t>::max()) {
    put(STR8, static_cast<uint8_t>(n));
  } else if (n <= std::numeric_limits<uint16_t>::max()) {
    put(STR16, static_cast<uint16_t>(n));
  } else {
    put(STR32, static_cast<uint32_t>(n));
  }
  put_raw(std::as_bytes(std::span(s.data(), s.size())));
  return *this;
}

BinaryEncoder &BinaryEncoder::append_binary(std::span<const std::byte> b) {
  auto n = b.size();
  check_length(n, "binary length");
  if (n <= std::numeric_limits<uint8_t>::max()) {
    put(BIN8, static_cast<uint8_t>(n));
  } else if (n <= std::numeric_limits<uint16_t>::max()) {
    put(BIN16, static_cast<uint16_t>(n));
  } else {
    put(BIN32, static_cast<uint32_t>(n));
  }
  put_raw(b);
  return *this;
}

BinaryEncoder &BinaryEncoder::start_map(size_t n) {
  check_length(n, "map size");
  if (n < 16) {
    put(static_cast<uint8_t>(FIXMAP | n));
  } else if (n <= std::numeric_limits<uint16_t>::max()) {
    put(MAP16, static_cast<uint16_t>(n));
  } else {
    put(MAP32, static_cast<uint32_t>(n));
  }
  return *this;
}

BinaryEncoder &BinaryEncoder::start_array(size_t n) {
  check_length(n, "array size");
  if (n < 16) {
    put(static_cast<uint8_t>(FIXARRAY | n));
  } else if (n <= std::numeric_limits<uint16_t>::max()) {
    put(ARRAY16, static_cast<uint16_t>(n));
  } else {
    put(ARRAY32, static_cast<uint32_t>(n));
  }
  return *this;
}

BinaryEncoder &BinaryEncoder::pipe(std::istream &in) {
  std::array<char, pipe_chunk_size> chunk;
  while (in) {
    in.read(chunk.data(), chunk.size());
    auto n = in.gcount();
    if (n > 0) {
      put_raw(std::as_bytes(std::span(chunk.data(), static_cast<size_t>(n))));
    }
  }
  if (in.bad()) {
    throw TransportError("Fail to read input stream");
  }
  return *this;
}

BinaryEncoder &BinaryEncoder::pipe(std::wistream &in) {
  std::array<wchar_t, pipe_chunk_size> chunk;
  while (in) {
    in.read(chunk.data(), chunk.size());
    auto n = in.gcount();
    if (n <= 0) {
      continue;
    }
    auto s = to_utf8(std::wstring_view(chunk.data(), static_cast<size_t>(n)));
    if (!s.has_value()) {
      throw UnsupportedValueError("malformed characters in reader", "std::wistream", "");
    }
    put_raw(std::as_bytes(std::span(s->data(), s->size())));
  }
  if (in.bad()) {
    throw TransportError("Fail to read character stream");
  }
  return *this;
}

}  // namespace gpk::codec

#pragma once

#include <zpp_bits.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string_view>

#include "codec/sink.hxx"
#include "codec/type_info.hxx"
#include "memory/local_buffer.hxx"
#include "util/noncopyable.hxx"

namespace gpk::codec {

// MessagePack framing of primitive values. Output is staged in a fixed-size buffer and handed to the sink when
// the buffer is full or on flush().
class BinaryEncoder : Noncopyable, Nonmovable {
  using Out = zpp::bits::out<LocalBuffer, zpp::bits::endian::big>;

 public:
  BinaryEncoder(Sink &sink_, size_t buffer_size);
  ~BinaryEncoder() = default;

  BinaryEncoder &append_null();
  BinaryEncoder &append_boolean(bool b);
  BinaryEncoder &append_int(int64_t i);
  BinaryEncoder &append_uint(uint64_t u);
  BinaryEncoder &append_float(float f);
  BinaryEncoder &append_double(double d);
  BinaryEncoder &append_number(const Number &n);
  // s must be UTF-8
  BinaryEncoder &append_string(std::string_view s);
  BinaryEncoder &append_binary(std::span<const std::byte> b);
  BinaryEncoder &start_map(size_t n);
  BinaryEncoder &start_array(size_t n);

  // raw copy, no header
  BinaryEncoder &pipe(std::istream &in);
  // transcoded to UTF-8, no header
  BinaryEncoder &pipe(std::wistream &in);

  void flush();

  // bytes produced so far, flushed or staged
  size_t written() const { return flushed + out.position(); }

 private:
  template <typename... Ts>
  void put(const Ts &...vs);
  void put_raw(std::span<const std::byte> bytes);
  void ensure(size_t n);
  void check_length(size_t n, std::string_view what) const;

  Sink &sink;
  OwnedBuffer buffer;
  Out out;
  size_t flushed = 0;
};

}  // namespace gpk::codec

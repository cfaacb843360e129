#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "util/noncopyable.hxx"

namespace gpk::codec {

// Destination of encoded bytes. Failures are reported as TransportError.
class Sink {
 public:
  virtual ~Sink() = default;

  virtual void write(std::span<const std::byte> bytes) = 0;
  // end of one serialization
  virtual void finish() {}
};

class VectorSink final : public Sink {
 public:
  VectorSink() = default;
  ~VectorSink() override = default;

  void write(std::span<const std::byte> bytes) override { b.insert(b.end(), bytes.begin(), bytes.end()); }

  const std::vector<std::byte> &bytes() const { return b; }
  std::vector<std::byte> take() { return std::move(b); }

 private:
  std::vector<std::byte> b;
};

class StringSink final : public Sink {
 public:
  StringSink() = default;
  ~StringSink() override = default;

  void write(std::span<const std::byte> bytes) override {
    s.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  }

  const std::string &str() const { return s; }
  std::string take() { return std::move(s); }

 private:
  std::string s;
};

class OStreamSink final : public Sink {
 public:
  explicit OStreamSink(std::ostream &out_) : out(out_) {}
  ~OStreamSink() override = default;

  void write(std::span<const std::byte> bytes) override;
  void finish() override;

 private:
  std::ostream &out;
};

// Writes to a file descriptor, retrying short and interrupted writes.
class FdSink final : public Sink, Noncopyable {
 public:
  explicit FdSink(int fd_, bool owned_ = false) : fd(fd_), owned(owned_) {}
  ~FdSink() override;

  void write(std::span<const std::byte> bytes) override;

 private:
  int fd;
  bool owned;
};

// Uppercase hex pairs, optionally separated by one space.
class HexSink final : public Sink {
 public:
  explicit HexSink(Sink &inner_, bool spaced_ = false) : inner(inner_), spaced(spaced_) {}
  ~HexSink() override = default;

  void write(std::span<const std::byte> bytes) override;
  void finish() override;

 private:
  Sink &inner;
  bool spaced;
  bool first = true;
};

// RFC 4648 base64 with padding. Partial groups are held until finish().
class Base64Sink final : public Sink {
 public:
  explicit Base64Sink(Sink &inner_) : inner(inner_) {}
  ~Base64Sink() override = default;

  void write(std::span<const std::byte> bytes) override;
  void finish() override;

 private:
  void encode_group(const uint8_t *in, size_t n, std::string &out) const;

  Sink &inner;
  std::array<uint8_t, 3> pending = {};
  size_t n_pending = 0;
};

}  // namespace gpk::codec

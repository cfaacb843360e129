#include "codec/sink.hxx"

#include <unistd.h>

#include <cerrno>
#include <string_view>

#include "codec/errors.hxx"
#include "util/hex_dump.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

namespace {

constexpr char base64_lookup[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

void write_text(Sink &s, std::string_view text) { s.write(std::as_bytes(std::span(text.data(), text.size()))); }

}  // namespace

void OStreamSink::write(std::span<const std::byte> bytes) {
  out.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  if (!out) {
    throw TransportError("Fail to write " + std::to_string(bytes.size()) + " bytes to stream");
  }
}

void OStreamSink::finish() {
  out.flush();
  if (!out) {
    throw TransportError("Fail to flush stream");
  }
}

FdSink::~FdSink() {
  if (owned && fd >= 0) {
    if (::close(fd) < 0) {
      WARN("Fail to close fd {}, errno: {}", fd, errno);
    }
  }
}

void FdSink::write(std::span<const std::byte> bytes) {
  auto p = bytes.data();
  auto n = bytes.size();
  while (n > 0) {
    auto ret = ::write(fd, p, n);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportError(errno, "Fail to write to fd " + std::to_string(fd));
    }
    p += ret;
    n -= ret;
  }
}

void HexSink::write(std::span<const std::byte> bytes) {
  std::string text;
  text.reserve(bytes.size() * 3);
  for (auto b : bytes) {
    auto c = std::to_integer<uint8_t>(b);
    if (spaced && !first) {
      text += ' ';
    }
    text += hex_lookup[c >> 4];
    text += hex_lookup[c & 0xF];
    first = false;
  }
  write_text(inner, text);
}

void HexSink::finish() {
  first = true;
  inner.finish();
}

void Base64Sink::encode_group(const uint8_t *in, size_t n, std::string &out) const {
  uint32_t v = static_cast<uint32_t>(in[0]) << 16;
  if (n > 1) {
    v |= static_cast<uint32_t>(in[1]) << 8;
  }
  if (n > 2) {
    v |= in[2];
  }
  out += base64_lookup[(v >> 18) & 0x3F];
  out += base64_lookup[(v >> 12) & 0x3F];
  out += n > 1 ? base64_lookup[(v >> 6) & 0x3F] : '=';
  out += n > 2 ? base64_lookup[v & 0x3F] : '=';
}

void Base64Sink::write(std::span<const std::byte> bytes) {
  std::string text;
  text.reserve((bytes.size() + n_pending) / 3 * 4 + 4);
  for (auto b : bytes) {
    pending[n_pending++] = std::to_integer<uint8_t>(b);
    if (n_pending == pending.size()) {
      encode_group(pending.data(), n_pending, text);
      n_pending = 0;
    }
  }
  if (!text.empty()) {
    write_text(inner, text);
  }
}

void Base64Sink::finish() {
  if (n_pending > 0) {
    std::string text;
    encode_group(pending.data(), n_pending, text);
    n_pending = 0;
    write_text(inner, text);
  }
  inner.finish();
}

}  // namespace gpk::codec

#include "codec/sink.hxx"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <sstream>
#include <string>

#include "codec/errors.hxx"
#include "codec/serializer.hxx"
#include "fixtures.hxx"

using namespace gpk::codec;
using namespace gpk::codec::testing;

namespace {

std::span<const std::byte> bytes_of(std::string_view s) { return std::as_bytes(std::span(s.data(), s.size())); }

std::string to_string_as(std::string_view format) {
  Options o;
  o.binary_format = format;
  Serializer s(o);
  return s.serialize_to_string(Pair{});
}

// accepts `limit` bytes, then fails like a closed pipe
class ClosingSink final : public Sink {
 public:
  explicit ClosingSink(size_t limit_) : limit(limit_) {}

  void write(std::span<const std::byte> bytes) override {
    if (written + bytes.size() > limit) {
      throw TransportError(EPIPE, "closed");
    }
    written += bytes.size();
  }

  size_t written = 0;

 private:
  size_t limit;
};

}  // namespace

TEST(SinkTest, BinaryFormats) {
  EXPECT_EQ(to_string_as("binary"), "\x82\xa1"
                                    "a\x01\xa1"
                                    "b\xa3"
                                    "foo");
  EXPECT_EQ(to_string_as("hex"), "82A16101A162A3666F6F");
  EXPECT_EQ(to_string_as("spaced-hex"), "82 A1 61 01 A1 62 A3 66 6F 6F");
  EXPECT_EQ(to_string_as("base64"), "gqFhAaFio2Zvbw==");
}

TEST(SinkTest, SpacedHexAcrossWrites) {
  StringSink s;
  HexSink h(s, true);
  h.write(bytes_of("\x01\x02"));
  h.write(bytes_of("\xff"));
  h.finish();
  EXPECT_EQ(s.str(), "01 02 FF");
}

TEST(SinkTest, Base64HoldsPartialGroups) {
  StringSink s;
  Base64Sink b(s);
  b.write(bytes_of("a"));
  b.write(bytes_of("bc"));
  b.write(bytes_of("d"));
  EXPECT_EQ(s.str(), "YWJj");
  b.finish();
  EXPECT_EQ(s.str(), "YWJjZA==");

  StringSink t;
  Base64Sink c(t);
  c.write(bytes_of("ab"));
  c.finish();
  EXPECT_EQ(t.str(), "YWI=");
}

TEST(SinkTest, OStream) {
  std::ostringstream out;
  OStreamSink s(out);
  Serializer serializer;
  EXPECT_EQ(serializer.serialize(int64_t{-1}, s), 1u);
  EXPECT_EQ(out.str(), "\xff");

  out.setstate(std::ios::badbit);
  EXPECT_THROW(s.write(bytes_of("x")), TransportError);
}

TEST(SinkTest, FileDescriptor) {
  std::array<int, 2> fds;
  ASSERT_EQ(::pipe(fds.data()), 0);
  {
    FdSink s(fds[1], true);
    Serializer serializer;
    EXPECT_EQ(serializer.serialize(Pair{}, s), 10u);
  }
  std::array<char, 32> buf{};
  auto n = ::read(fds[0], buf.data(), buf.size());
  ::close(fds[0]);
  ASSERT_EQ(n, 10);
  EXPECT_EQ(spaced_hex(bytes_of(std::string_view(buf.data(), n))), "82 A1 61 01 A1 62 A3 66 6F 6F");
}

TEST(SinkTest, BadFileDescriptor) {
  FdSink s(-1);
  try {
    s.write(bytes_of("x"));
    FAIL() << "write to a closed descriptor succeeded";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.code().value(), EBADF);
  }
}

TEST(SinkTest, WriteFailureAbortsSerialization) {
  Options o;
  o.buffer_size = 16;
  Serializer s(o);
  std::vector<std::string> v(100, "some text");
  ClosingSink out(64);
  try {
    s.serialize(v, out);
    FAIL() << "serialization into a closed sink succeeded";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.code().value(), EPIPE);
  }
  EXPECT_LE(out.written, 64u);
}

#include "codec/decoder.hxx"

#include <gtest/gtest.h>

#include <cfloat>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "codec/errors.hxx"
#include "codec/serializer.hxx"
#include "fixtures.hxx"

using namespace gpk::codec;
using namespace gpk::codec::testing;

namespace {

std::string raw(std::initializer_list<uint8_t> bytes) { return std::string(bytes.begin(), bytes.end()); }

}  // namespace

TEST(DecoderTest, DecodesSerializedBean) {
  Serializer s;
  auto n = Decoder::decode(s.serialize_to_bytes(Pair{}));
  ASSERT_TRUE(n.is<NodeMap>());
  ASSERT_EQ(n.as<NodeMap>().size(), 2u);
  EXPECT_EQ(*n.find("a"), Node{uint64_t{1}});
  EXPECT_EQ(*n.find("b"), Node{std::string("foo")});
  EXPECT_EQ(n.find("c"), nullptr);
  EXPECT_EQ(std::format("{}", n), "{\"a\": 1, \"b\": \"foo\"}");
}

TEST(DecoderTest, DecodesEveryScalarForm) {
  EXPECT_TRUE(Decoder::decode(raw({0xc0})).is_null());
  EXPECT_EQ(Decoder::decode(raw({0xc3})), Node{true});
  EXPECT_EQ(Decoder::decode(raw({0xff})), Node{int64_t{-1}});
  EXPECT_EQ(Decoder::decode(raw({0xd1, 0xff, 0x7f})), Node{int64_t{-129}});
  EXPECT_EQ(Decoder::decode(raw({0xcd, 0x01, 0x2c})), Node{uint64_t{300}});
  EXPECT_EQ(Decoder::decode(raw({0xca, 0x3f, 0xc0, 0x00, 0x00})), Node{1.5f});
  EXPECT_EQ(Decoder::decode(raw({0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0})), Node{1.5});
  EXPECT_EQ(Decoder::decode(raw({0xc4, 0x02, 0x01, 0x02})), Node{Binary{std::byte{1}, std::byte{2}}});
  EXPECT_EQ(Decoder::decode(raw({0xd9, 0x01, 0x78})), Node{std::string("x")});
}

TEST(DecoderTest, RoundTripsNestedGraph) {
  std::map<std::string, std::vector<int>> m{{"x", {1, -40, 70000}}, {"y", {}}};
  Serializer s;
  auto n = Decoder::decode(s.serialize_to_bytes(m));
  EXPECT_EQ(std::format("{}", n), "{\"x\": [1, -40, 70000], \"y\": []}");
}

TEST(DecoderTest, RoundTripsBoundaryValues) {
  Serializer s;
  auto round_trip = [&](const auto &v) { return Decoder::decode(s.serialize_to_bytes(v)); };

  EXPECT_EQ(round_trip(std::numeric_limits<int64_t>::min()), Node{std::numeric_limits<int64_t>::min()});
  EXPECT_EQ(round_trip(std::numeric_limits<int64_t>::max()),
            Node{uint64_t{std::numeric_limits<int64_t>::max()}});
  EXPECT_EQ(round_trip(std::numeric_limits<uint64_t>::max()), Node{std::numeric_limits<uint64_t>::max()});
  EXPECT_EQ(round_trip(int64_t{-33}), Node{int64_t{-33}});
  EXPECT_EQ(round_trip(int64_t{-129}), Node{int64_t{-129}});
  EXPECT_EQ(round_trip(int32_t{128}), Node{uint64_t{128}});

  auto negative_zero = round_trip(-0.0);
  ASSERT_TRUE(negative_zero.is<double>());
  EXPECT_EQ(negative_zero.as<double>(), 0.0);
  EXPECT_TRUE(std::signbit(negative_zero.as<double>()));
  EXPECT_EQ(round_trip(std::numeric_limits<double>::infinity()), Node{std::numeric_limits<double>::infinity()});
  EXPECT_EQ(round_trip(-std::numeric_limits<double>::infinity()), Node{-std::numeric_limits<double>::infinity()});
  EXPECT_EQ(round_trip(DBL_MAX), Node{DBL_MAX});
  EXPECT_EQ(round_trip(DBL_TRUE_MIN), Node{DBL_TRUE_MIN});
  EXPECT_EQ(round_trip(FLT_MAX), Node{FLT_MAX});

  std::string euros;
  for (auto i = 0; i < 12; ++i) {
    euros += "\xe2\x82\xac";
  }
  ASSERT_EQ(euros.size(), 36u);
  EXPECT_EQ(round_trip(euros), Node{euros});

  std::vector<std::byte> blob(300);
  for (auto i = 0uz; i < blob.size(); ++i) {
    blob[i] = std::byte(i % 256);
  }
  EXPECT_EQ(round_trip(blob), Node{Binary(blob)});

  auto bean = round_trip(Pair{});
  EXPECT_EQ(*bean.find("a"), Node{uint64_t{1}});
  EXPECT_EQ(*bean.find("b"), Node{std::string("foo")});
}

TEST(DecoderTest, SortedSerializationIsDeterministic) {
  Options o;
  o.sort_maps = true;
  Serializer s(o);
  std::unordered_map<int, std::string> m{{3, "c"}, {1, "a"}, {2, "b"}};
  auto first = s.serialize_to_bytes(m);
  EXPECT_EQ(first, s.serialize_to_bytes(m));
  EXPECT_EQ(std::format("{}", Decoder::decode(first)), "{1: \"a\", 2: \"b\", 3: \"c\"}");
}

TEST(DecoderTest, RejectsMalformedInput) {
  EXPECT_THROW(Decoder::decode(raw({})), DecodeError);
  EXPECT_THROW(Decoder::decode(raw({0xcd, 0x01})), DecodeError);
  EXPECT_THROW(Decoder::decode(raw({0xc1})), DecodeError);
  EXPECT_THROW(Decoder::decode(raw({0x92, 0x01})), DecodeError);
  EXPECT_THROW(Decoder::decode(raw({0xa3, 0x61})), DecodeError);
  try {
    Decoder::decode(raw({0x01, 0x02}));
    FAIL() << "trailing byte accepted";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.offset(), 1);
  }
}

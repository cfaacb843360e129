#include "codec/graph_walker.hxx"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "codec/errors.hxx"
#include "codec/serializer.hxx"
#include "fixtures.hxx"

using namespace gpk::codec;
using namespace gpk::codec::testing;

TEST(GraphWalkerTest, EncodesBeanAsMap) {
  EXPECT_EQ(encode_hex(Pair{}), "82 A1 61 01 A1 62 A3 66 6F 6F");
}

TEST(GraphWalkerTest, EncodesScalars) {
  EXPECT_EQ(encode_hex(true), "C3");
  EXPECT_EQ(encode_hex(-5), "FB");
  EXPECT_EQ(encode_hex(300u), "CD 01 2C");
  EXPECT_EQ(encode_hex(1.5f), "CA 3F C0 00 00");
  EXPECT_EQ(encode_hex(1.5), "CB 3F F8 00 00 00 00 00 00");
  EXPECT_EQ(encode_hex(std::string("foo")), "A3 66 6F 6F");
  EXPECT_EQ(encode_hex("foo"), "A3 66 6F 6F");
  EXPECT_EQ(encode_hex('a'), "A1 61");
  EXPECT_EQ(encode_hex(U'é'), "A2 C3 A9");
  EXPECT_EQ(encode_hex(std::u16string(u"hé")), "A3 68 C3 A9");
}

TEST(GraphWalkerTest, EncodesNulls) {
  EXPECT_EQ(encode_hex(Value()), "C0");
  EXPECT_EQ(encode_hex(std::optional<int>()), "C0");
  EXPECT_EQ(encode_hex(std::unique_ptr<Pair>()), "C0");
  EXPECT_EQ(encode_hex('\0'), "C0");
  EXPECT_EQ(encode_hex(static_cast<const char *>(nullptr)), "C0");
  EXPECT_EQ(encode_hex(std::optional<int>(7)), "07");
}

TEST(GraphWalkerTest, EncodesContainers) {
  EXPECT_EQ(encode_hex(std::vector<int>{1, 2, 3}), "93 01 02 03");
  EXPECT_EQ(encode_hex(std::array<int, 2>{4, 5}), "92 04 05");
  EXPECT_EQ(encode_hex(std::vector<bool>{true, false}), "92 C3 C2");
  EXPECT_EQ(encode_hex(std::map<int, std::string>{{1, "a"}}), "81 01 A1 61");
  EXPECT_EQ(encode_hex(std::vector<uint8_t>{1, 2, 3}), "C4 03 01 02 03");
  EXPECT_EQ(encode_hex(std::vector<std::optional<int>>{1, std::nullopt}), "92 01 C0");
}

TEST(GraphWalkerTest, PipesStreams) {
  std::istringstream in("abc");
  EXPECT_EQ(encode_hex(in), "61 62 63");
  std::wistringstream reader(L"hé");
  EXPECT_EQ(encode_hex(reader), "68 C3 A9");
}

TEST(GraphWalkerTest, CycleThroughBeanPropertyIsOmitted) {
  Person a("a"), b("b");
  a.next = &b;
  b.next = &a;
  // {name: "a", next: {name: "b"}}
  EXPECT_EQ(encode_hex(a), "82 A4 6E 61 6D 65 A1 61 A4 6E 65 78 74 81 A4 6E 61 6D 65 A1 62");
}

TEST(GraphWalkerTest, CycleWithKeepNullIsWrittenAsNull) {
  Person a("a"), b("b");
  a.next = &b;
  b.next = &a;
  Options o;
  o.keep_null_properties = true;
  // {name: "a", next: {name: "b", next: null}}
  EXPECT_EQ(encode_hex(a, o), "82 A4 6E 61 6D 65 A1 61 A4 6E 65 78 74 82 A4 6E 61 6D 65 A1 62 A4 6E 65 78 74 C0");
}

TEST(GraphWalkerTest, CycleThroughGetterIsOmitted) {
  Member a("a"), b("b");
  a.next = &b;
  b.next = &a;
  // {name: "a", next: {name: "b"}}
  EXPECT_EQ(encode_hex(a), "82 A4 6E 61 6D 65 A1 61 A4 6E 65 78 74 81 A4 6E 61 6D 65 A1 62");
  Options o;
  o.keep_null_properties = true;
  EXPECT_EQ(encode_hex(a, o), "82 A4 6E 61 6D 65 A1 61 A4 6E 65 78 74 82 A4 6E 61 6D 65 A1 62 A4 6E 65 78 74 C0");
}

TEST(GraphWalkerTest, GetterKeepsRuntimeType) {
  Options o;
  o.add_bean_types = true;
  // {main: {_type: "circle", id: 0, radius: 2}}
  EXPECT_EQ(encode_hex(Canvas{}, o),
            "81 A4 6D 61 69 6E 83 A5 5F 74 79 70 65 A6 63 69 72 63 6C 65 A2 69 64 00 A6 72 61 64 69 75 73 02");
}

TEST(GraphWalkerTest, CycleThroughCollectionIsNull) {
  std::vector<Value> self;
  self.push_back(Value::of(self));
  self.push_back(Value::own(1));
  EXPECT_EQ(encode_hex(self), "92 C0 01");
}

TEST(GraphWalkerTest, NullPropertiesAreDroppedUnlessKept) {
  Person p("p");
  EXPECT_EQ(encode_hex(p), "81 A4 6E 61 6D 65 A1 70");
  Options o;
  o.keep_null_properties = true;
  EXPECT_EQ(encode_hex(p, o), "82 A4 6E 61 6D 65 A1 70 A4 6E 65 78 74 C0");
}

TEST(GraphWalkerTest, SharedValuesAreNotCycles) {
  auto shared = std::make_shared<Pair>();
  std::vector<std::shared_ptr<Pair>> twice{shared, shared};
  auto one = encode_hex(*shared);
  EXPECT_EQ(encode_hex(twice), "92 " + one + " " + one);
}

TEST(GraphWalkerTest, FailingGetterIsReportedAndSkipped) {
  Serializer s;
  std::vector<GetterError> errors;
  s.set_getter_error_handler([&](const GetterError &e) { errors.push_back(e); });
  auto bytes = s.serialize_to_bytes(Flaky{});
  EXPECT_EQ(spaced_hex(bytes), "82 A1 61 01 A1 63 03");
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0].property, "b");
  EXPECT_EQ(errors[0].message, "boom");
  ASSERT_EQ(s.warnings().size(), 1);
  EXPECT_NE(s.warnings()[0].find("boom"), std::string::npos);

  s.serialize_to_bytes(Pair{});
  EXPECT_TRUE(s.warnings().empty());
}

TEST(GraphWalkerTest, SwapIsEquivalentToSurrogate) {
  SwapRegistry swaps;
  swaps.add<Celsius>(make_swap<Celsius>([](const Celsius &c) { return std::format("{}C", c.degrees); }));
  Serializer s({}, std::move(swaps));
  EXPECT_EQ(s.serialize_to_bytes(Celsius{21.5}), s.serialize_to_bytes(std::string("21.5C")));
  std::vector<Celsius> v{{1}, {2}};
  EXPECT_EQ(spaced_hex(s.serialize_to_bytes(v)), "92 A2 31 43 A2 32 43");
}

TEST(GraphWalkerTest, SwapOnPropertyIsEquivalentToSurrogate) {
  SwapRegistry swaps;
  swaps.add<Celsius>(make_swap<Celsius>([](const Celsius &c) { return std::format("{}C", c.degrees); }));
  Serializer s({}, std::move(swaps));
  auto bytes = s.serialize_to_bytes(Reading{{21.5}});
  EXPECT_EQ(bytes, s.serialize_to_bytes(std::map<std::string, std::string>{{"t", "21.5C"}}));
  // {t: "21.5C"}
  EXPECT_EQ(spaced_hex(bytes), "81 A1 74 A5 32 31 2E 35 43");
}

TEST(GraphWalkerTest, SwapToAnyUsesSurrogateType) {
  SwapRegistry swaps;
  swaps.add<Celsius>(make_swap<Celsius>([](const Celsius &c) {
    return Value::own(std::vector<int>{static_cast<int>(c.degrees), 0});
  }));
  Serializer s({}, std::move(swaps));
  EXPECT_EQ(spaced_hex(s.serialize_to_bytes(Celsius{3})), "92 03 00");
}

TEST(GraphWalkerTest, SwapIsAppliedOnce) {
  SwapRegistry swaps;
  swaps.add<std::string>(make_swap<std::string>([](const std::string &s) { return s + "!"; }));
  Serializer s({}, std::move(swaps));
  EXPECT_EQ(spaced_hex(s.serialize_to_bytes(std::string("a"))), "A2 61 21");
}

TEST(GraphWalkerTest, SortedOutputIsDeterministic) {
  Options o;
  o.sort_maps = true;
  o.sort_collections = true;
  std::unordered_map<std::string, int> m;
  std::map<std::string, int> ordered;
  for (int i = 0; i < 50; ++i) {
    m.emplace("k" + std::to_string(i), i);
    ordered.emplace("k" + std::to_string(i), i);
  }
  EXPECT_EQ(encode_hex(m, o), encode_hex(ordered, o));
  EXPECT_EQ(encode_hex(std::vector<int>{3, 1, 2}, o), "93 01 02 03");
  EXPECT_EQ(encode_hex(std::vector<int>{3, 1, 2}), "93 03 01 02");
}

TEST(GraphWalkerTest, DepthIsBounded) {
  std::vector<std::vector<std::vector<int>>> deep{{{1}}};
  Options o;
  o.max_depth = 2;
  EXPECT_THROW(encode_hex(deep, o), DepthExceededError);
  o.max_depth = 3;
  EXPECT_EQ(encode_hex(deep, o), "91 91 91 01");
}

TEST(GraphWalkerTest, DepthErrorCarriesPath) {
  Person a("a"), b("b"), c("c");
  a.next = &b;
  b.next = &c;
  Options o;
  o.max_depth = 2;
  try {
    encode_hex(a, o);
    FAIL() << "depth not enforced";
  } catch (const DepthExceededError &e) {
    EXPECT_EQ(e.path(), "root/next/next");
  }
}

TEST(GraphWalkerTest, DepthErrorNamesMapValueByType) {
  std::map<int, std::vector<std::vector<int>>> m{{1, {{2}}}};
  Options o;
  o.max_depth = 2;
  try {
    encode_hex(m, o);
    FAIL() << "depth not enforced";
  } catch (const DepthExceededError &e) {
    EXPECT_TRUE(e.path().starts_with("root/<std::vector<std::vector<int")) << e.path();
    EXPECT_FALSE(e.path().ends_with("/")) << e.path();
    EXPECT_TRUE(e.path().substr(e.path().rfind('/')).starts_with("/<std::vector<int")) << e.path();
  }
}

TEST(GraphWalkerTest, BeanTypeNamesWhenRequested) {
  std::vector<std::shared_ptr<Shape>> shapes{std::make_shared<Circle>()};
  // [{id: 0, radius: 2}]
  EXPECT_EQ(encode_hex(shapes), "91 82 A2 69 64 00 A6 72 61 64 69 75 73 02");
  Options o;
  o.add_bean_types = true;
  // [{_type: "circle", id: 0, radius: 2}]
  EXPECT_EQ(encode_hex(shapes, o),
            "91 83 A5 5F 74 79 70 65 A6 63 69 72 63 6C 65 A2 69 64 00 A6 72 61 64 69 75 73 02");
}

TEST(GraphWalkerTest, RootTypeName) {
  Options o;
  o.add_root_type = true;
  o.bean_type_property_name = "t";
  // {t: "pair", a: 1, b: "foo"}
  EXPECT_EQ(encode_hex(Pair{}, o), "83 A1 74 A4 70 61 69 72 A1 61 01 A1 62 A3 66 6F 6F");
  EXPECT_EQ(encode_hex(Pair{}), "82 A1 61 01 A1 62 A3 66 6F 6F");
}

TEST(GraphWalkerTest, ResolvesUris) {
  Options o;
  o.uri_context = {"http://localhost:8080", "/app", "/rest", "/foo"};
  o.uri_resolution = "root-relative";
  Link l{"bar", "x"};
  // {href: "/app/rest/bar", title: "x"}
  EXPECT_EQ(encode_hex(l, o), "82 A4 68 72 65 66 AD 2F 61 70 70 2F 72 65 73 74 2F 62 61 72 A5 74 69 74 6C 65 A1 78");
  EXPECT_EQ(encode_hex(Uri{"context:/x"}, o), "A6 2F 61 70 70 2F 78");
  o.uri_resolution = "none";
  EXPECT_EQ(encode_hex(Uri{"context:/x"}, o), "AA 63 6F 6E 74 65 78 74 3A 2F 78");
}

TEST(GraphWalkerTest, TrimsStringsWhenAsked) {
  Options o;
  o.trim_strings = true;
  EXPECT_EQ(encode_hex(std::string("  hi \n"), o), "A2 68 69");
  EXPECT_EQ(encode_hex(std::string("  hi \n")), "A6 20 20 68 69 20 0A");
}

TEST(GraphWalkerTest, FormatsTimePoints) {
  using namespace std::chrono;
  system_clock::time_point tp = sys_days{2012y / 3 / 4} + 5h + 6min + 7s;
  Options o;
  o.date_format = "ISO_LOCAL_DATE";
  EXPECT_EQ(encode_hex(tp, o), "AA 32 30 31 32 2D 30 33 2D 30 34");
}

TEST(GraphWalkerTest, UnsupportedValueNamesItsPlace) {
  try {
    encode_hex(Holder{});
    FAIL() << "opaque value encoded";
  } catch (const UnsupportedValueError &e) {
    EXPECT_EQ(e.path(), "root/x");
    EXPECT_NE(e.type_name().find("Opaque"), std::string::npos);
  }
}

TEST(GraphWalkerTest, MalformedUtf8IsUnsupported) {
  EXPECT_THROW(encode_hex(std::string("\xff")), UnsupportedValueError);
  EXPECT_THROW(encode_hex(std::string("a\xc3")), UnsupportedValueError);
  EXPECT_THROW(encode_hex(std::u16string(1, char16_t(0xd800))), UnsupportedValueError);
  EXPECT_EQ(encode_hex(std::string("h\xc3\xa9")), "A3 68 C3 A9");
  EXPECT_EQ(encode_hex(std::u8string(u8"h\u00e9")), "A3 68 C3 A9");
}

TEST(GraphWalkerTest, TrimAppliesToPropertyNames) {
  // {" padded ": " x "}
  EXPECT_EQ(encode_hex(Padded{}), "81 A8 20 70 61 64 64 65 64 20 A3 20 78 20");
  Options o;
  o.trim_strings = true;
  // {padded: "x"}
  EXPECT_EQ(encode_hex(Padded{}, o), "81 A6 70 61 64 64 65 64 A1 78");
}

TEST(GraphWalkerTest, SerializerIsReusable) {
  Serializer s;
  auto first = s.serialize_to_bytes(Pair{});
  auto second = s.serialize_to_bytes(Pair{});
  EXPECT_EQ(first, second);
}

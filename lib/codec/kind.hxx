#pragma once

#include <cstdint>

#include "util/enum_formatter.hxx"

namespace gpk::codec {

// Static shape of a C++ type, decided once per type when its descriptor is built.
enum class Category : uint8_t {
  Any,       // gpk::codec::Value, the runtime type lives in the handle
  Optional,  // std::optional, pointers, smart pointers, reference_wrapper
  Boolean,
  Char,
  Integer,
  Float,
  String,
  Uri,
  ByteArray,
  Map,
  Collection,
  Array,
  Bean,
  Reader,
  InputStream,
  Other,
};

// Semantic kind of one occurrence of a value, drives the encode routine.
enum class Kind : uint8_t {
  Null,
  Boolean,
  Number,
  String,
  Uri,
  ByteArray,
  Map,
  Collection,
  Array,
  Bean,
  Reader,
  InputStream,
  Other,
};

inline bool is_holder(Category c) { return c == Category::Any || c == Category::Optional; }

// only containers and beans can lead back to an ancestor
inline bool is_recursion_candidate(Category c) {
  return c == Category::Map || c == Category::Collection || c == Category::Array || c == Category::Bean;
}

}  // namespace gpk::codec

// clang-format off
EnumFormatter(gpk::codec::Category,
    "Any", "Optional", "Boolean", "Char", "Integer", "Float", "String", "Uri",
    "ByteArray", "Map", "Collection", "Array", "Bean", "Reader", "InputStream", "Other");
EnumFormatter(gpk::codec::Kind,
    "Null", "Boolean", "Number", "String", "Uri", "ByteArray", "Map", "Collection",
    "Array", "Bean", "Reader", "InputStream", "Other");
// clang-format on

#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "codec/type_info.hxx"

namespace gpk::codec {

// strict weak ordering on values
using Comparator = std::function<bool(const Value &, const Value &)>;

// Null, then booleans, then numbers by value, then strings by UTF-8 bytes, then everything else by its text.
int natural_compare(const Value &a, const Value &b);
bool natural_less(const Value &a, const Value &b);

// Snapshots container content before any header is written, sorted when the policy asks for it.
class CollectionOrderer {
 public:
  CollectionOrderer(bool sort_maps_, bool sort_collections_, Comparator less_ = natural_less)
      : sort_maps(sort_maps_), sort_collections(sort_collections_), less(std::move(less_)) {}
  ~CollectionOrderer() = default;

  std::vector<std::pair<Value, Value>> entries(const Value &map) const;
  // collections and arrays
  std::vector<Value> elements(const Value &c) const;

 private:
  bool sort_maps;
  bool sort_collections;
  Comparator less;
};

}  // namespace gpk::codec

#pragma once

#include "codec/kind.hxx"
#include "codec/type_info.hxx"

namespace gpk::codec {

// Maps one resolved value to the kind that selects its encode routine. uri marks a property declared as a URI.
class ValueClassifier {
 public:
  static Kind classify(const Value &v, bool uri = false);
};

}  // namespace gpk::codec

#include "codec/classifier.hxx"

#include "util/fatal.hxx"

namespace gpk::codec {

Kind ValueClassifier::classify(const Value &v, bool uri) {
  if (v.is_null()) {
    return Kind::Null;
  }
  auto &t = v.type();
  // a NUL character counts as null
  if (t.is_null(v.object())) {
    return Kind::Null;
  }
  switch (t.category()) {
    case Category::Boolean:
      return Kind::Boolean;
    case Category::Integer:
    case Category::Float:
      return Kind::Number;
    case Category::Bean:
      return Kind::Bean;
    default:
      break;
  }
  if (uri || t.category() == Category::Uri) {
    return Kind::Uri;
  }
  switch (t.category()) {
    case Category::Map:
      return Kind::Map;
    case Category::Collection:
      return Kind::Collection;
    case Category::ByteArray:
      return Kind::ByteArray;
    case Category::Array:
      return Kind::Array;
    case Category::Reader:
      return Kind::Reader;
    case Category::InputStream:
      return Kind::InputStream;
    case Category::String:
    case Category::Char:
      return Kind::String;
    case Category::Other:
      return Kind::Other;
    case Category::Any:
    case Category::Optional:
      die("holder {} reached the classifier unresolved", t.name());
    default:
      unreachable();
  }
}

}  // namespace gpk::codec

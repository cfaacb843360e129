#include "codec/type_info.hxx"

#include <boost/core/demangle.hpp>

#include "util/fatal.hxx"

namespace gpk::codec {

std::string type_name(const std::type_info &t) { return boost::core::demangle(t.name()); }

std::string TypeDescriptor::name() const { return type_name(type()); }

void TypeDescriptor::unsupported(std::string_view op) const {
  die("{} of {} is not supported by category {}", op, name(), category());
}

Value TypeDescriptor::unwrap(const void *) const { unsupported("unwrap"); }
const TypeDescriptor &TypeDescriptor::target() const { unsupported("target"); }
bool TypeDescriptor::is_null(const void *) const { return false; }
bool TypeDescriptor::as_bool(const void *) const { unsupported("as_bool"); }
Number TypeDescriptor::as_number(const void *) const { unsupported("as_number"); }
std::optional<std::string> TypeDescriptor::to_string(const void *) const { return std::nullopt; }
std::span<const std::byte> TypeDescriptor::as_bytes(const void *) const { unsupported("as_bytes"); }
std::vector<std::pair<Value, Value>> TypeDescriptor::entries(const void *) const { unsupported("entries"); }
std::vector<Value> TypeDescriptor::elements(const void *) const { unsupported("elements"); }
const TypeDescriptor &TypeDescriptor::key_type() const { unsupported("key_type"); }
const TypeDescriptor &TypeDescriptor::element_type() const { unsupported("element_type"); }
void TypeDescriptor::properties(const void *, PropertyList &) const { unsupported("properties"); }
std::string_view TypeDescriptor::bean_type_name(const void *) const { return {}; }
std::istream &TypeDescriptor::input_stream(const void *) const { unsupported("input_stream"); }
std::wistream &TypeDescriptor::reader(const void *) const { unsupported("reader"); }

Value resolve(Value v, const TypeDescriptor *&declared) {
  while (declared->category() == Category::Optional) {
    declared = &declared->target();
  }
  while (!v.is_null() && is_holder(v.type().category())) {
    Value inner = v.type().unwrap(v.object());
    inner.keep_alive(v);
    v = std::move(inner);
  }
  return v;
}

}  // namespace gpk::codec

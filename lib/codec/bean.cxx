#include "codec/bean.hxx"

#include "codec/type_info.hxx"

namespace gpk::codec {

std::vector<PropertyValue> BeanPropertyEnumerator::enumerate(const Value &bean, bool keep_null,
                                                             std::string_view type_property,
                                                             std::string_view type_name) {
  PropertyList l;
  if (!type_name.empty()) {
    l.add(type_property, std::string(type_name));
  }
  bean.type().properties(bean.object(), l);

  std::vector<PropertyValue> r;
  r.reserve(l.size());
  for (auto &p : l.values()) {
    p.value.keep_alive(bean);
    if (!keep_null && p.thrown == nullptr) {
      auto declared = p.declared;
      if (resolve(p.value, declared).is_null()) {
        continue;
      }
    }
    r.push_back(std::move(p));
  }
  return r;
}

}  // namespace gpk::codec

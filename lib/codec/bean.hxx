#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "codec/value.hxx"

namespace gpk::codec {

class PropertyList;

// Capability interface of a bean: a fixed, named, ordered set of readable properties.
class PropertyEnumerable {
 public:
  virtual ~PropertyEnumerable() = default;

  virtual void properties(PropertyList &l) const = 0;

  // dictionary name written as the bean type property, empty when the bean has none
  virtual std::string_view type_name() const { return {}; }
};

// Non-intrusive registration of a bean type. Specializations provide
//   static void properties(const T &, PropertyList &);
// and optionally
//   static std::string_view type_name(const T &);
template <typename T>
struct BeanTraits {};

template <typename T>
concept RegisteredBean = requires(const T &t, PropertyList &l) { BeanTraits<T>::properties(t, l); };

template <typename T>
concept BeanType = std::derived_from<T, PropertyEnumerable> || RegisteredBean<T>;

struct PropertyValue {
  std::string name;
  Value value;
  const TypeDescriptor *declared = nullptr;
  bool uri = false;
  std::exception_ptr thrown = nullptr;  // the accessor raised, value is null
};

class PropertyList {
 public:
  PropertyList() = default;
  ~PropertyList() = default;

  template <typename T>
  PropertyList &add(std::string_view name, T &&value) {
    return push(name, std::forward<T>(value), false);
  }

  // the value is resolved against the URI context whatever its type
  template <typename T>
  PropertyList &uri(std::string_view name, T &&value) {
    return push(name, std::forward<T>(value), true);
  }

  // Invokes the getter now; an exception becomes the read failure of the property. A getter returning an lvalue
  // reference is borrowed, so the referenced object keeps its identity and runtime type.
  template <typename Getter>
  PropertyList &read(std::string_view name, Getter &&getter) {
    using R = std::invoke_result_t<Getter>;
    using T = std::remove_cvref_t<R>;
    PropertyValue p{std::string(name), {}, &descriptor_of<T>(), false, nullptr};
    try {
      if constexpr (std::is_lvalue_reference_v<R>) {
        p.value = Value::of(std::invoke(std::forward<Getter>(getter)));
      } else {
        p.value = Value::own(std::invoke(std::forward<Getter>(getter)));
      }
    } catch (...) {
      p.thrown = std::current_exception();
    }
    l.push_back(std::move(p));
    return *this;
  }

  std::vector<PropertyValue> &values() { return l; }
  size_t size() const { return l.size(); }

 private:
  template <typename T>
  PropertyList &push(std::string_view name, T &&value, bool uri) {
    using U = std::remove_cvref_t<T>;
    PropertyValue p{std::string(name), {}, &descriptor_of<U>(), uri, nullptr};
    if constexpr (std::is_lvalue_reference_v<T>) {
      p.value = Value::of(value);
    } else {
      p.value = Value::own(std::move(value));
    }
    l.push_back(std::move(p));
    return *this;
  }

  std::vector<PropertyValue> l;
};

// Produces the property values of one bean for one walk.
class BeanPropertyEnumerator {
 public:
  // When keep_null is off, properties whose value is null are dropped. A non-empty type_name is emitted first
  // under type_property.
  static std::vector<PropertyValue> enumerate(const Value &bean, bool keep_null, std::string_view type_property,
                                              std::string_view type_name);
};

}  // namespace gpk::codec

#pragma once

#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace gpk::codec {

class TypeDescriptor;

template <typename T>
const TypeDescriptor &descriptor_of();

// Identity of an object on the descent path: most-derived address plus runtime type. Two objects sharing an
// address (a struct and its first member) never share a type.
struct Identity {
  const void *address = nullptr;
  const std::type_info *type = nullptr;

  bool operator==(const Identity &other) const {
    return address == other.address && (type == other.type || (type && other.type && *type == *other.type));
  }
};

// Handle on a value being serialized. A borrowed handle points into the caller's graph and is never used to
// mutate it. An owned handle keeps a value produced during the walk (swap result, getter result) alive.
class Value {
 public:
  Value() = default;
  ~Value() = default;

  template <typename T>
  static Value of(const T &object) {
    Value v;
    v.o = std::addressof(object);
    v.t = &descriptor_of<T>();
    if constexpr (std::is_polymorphic_v<T>) {
      v.id = {dynamic_cast<const void *>(std::addressof(object)), &typeid(object)};
    } else {
      v.id = {v.o, &typeid(T)};
    }
    return v;
  }

  template <typename T>
  static Value own(T &&object);

  bool is_null() const { return o == nullptr; }
  explicit operator bool() const { return o != nullptr; }

  const void *object() const { return o; }
  const TypeDescriptor &type() const { return *t; }
  const Identity &identity() const { return id; }
  bool owning() const { return owner != nullptr; }

  // a handle derived from this one (unwrapped, element of) must not outlive the storage it borrows from
  Value &keep_alive(const Value &parent) {
    if (owner == nullptr) {
      owner = parent.owner;
    }
    return *this;
  }

  // nullptr unless the static or the runtime type of the handle is exactly T
  template <typename T>
  const T *get() const;

 private:
  const void *o = nullptr;
  const TypeDescriptor *t = nullptr;
  Identity id;
  std::shared_ptr<const void> owner;
};

}  // namespace gpk::codec

#pragma once

#include <cstdint>
#include <format>
#include <istream>
#include <optional>
#include <ranges>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "codec/bean.hxx"
#include "codec/kind.hxx"
#include "codec/traits.hxx"
#include "codec/uri.hxx"
#include "codec/utf.hxx"
#include "codec/value.hxx"
#include "util/enum_formatter.hxx"

namespace gpk::codec {

using Number = std::variant<int64_t, uint64_t, float, double>;

// demangled name of a type
std::string type_name(const std::type_info &t);

// Type-erased view of a C++ type, built once per type. Operations not matching the category die.
class TypeDescriptor {
 public:
  virtual ~TypeDescriptor() = default;

  virtual Category category() const = 0;
  virtual const std::type_info &type() const = 0;
  std::string name() const;

  // Any and Optional: the target, or a null handle
  virtual Value unwrap(const void *o) const;
  // Optional: declared type of the target
  virtual const TypeDescriptor &target() const;

  // null C string, NUL character
  virtual bool is_null(const void *o) const;

  virtual bool as_bool(const void *o) const;
  virtual Number as_number(const void *o) const;
  // UTF-8 text of a String, Char, Uri or Other value, nullopt when it has none
  virtual std::optional<std::string> to_string(const void *o) const;
  virtual std::span<const std::byte> as_bytes(const void *o) const;

  virtual std::vector<std::pair<Value, Value>> entries(const void *o) const;
  virtual std::vector<Value> elements(const void *o) const;
  virtual const TypeDescriptor &key_type() const;
  virtual const TypeDescriptor &element_type() const;

  virtual void properties(const void *o, PropertyList &l) const;
  virtual std::string_view bean_type_name(const void *o) const;

  // streams are consumed by the walk
  virtual std::istream &input_stream(const void *o) const;
  virtual std::wistream &reader(const void *o) const;

 protected:
  [[noreturn]] void unsupported(std::string_view op) const;
};

template <typename T>
constexpr Category category_of() {
  if constexpr (std::is_same_v<T, Value>) {
    return Category::Any;
  } else if constexpr (OptionalType<T>) {
    return Category::Optional;
  } else if constexpr (BooleanType<T>) {
    return Category::Boolean;
  } else if constexpr (CharType<T>) {
    return Category::Char;
  } else if constexpr (IntegerType<T>) {
    return Category::Integer;
  } else if constexpr (FloatType<T>) {
    return Category::Float;
  } else if constexpr (std::is_same_v<T, Uri>) {
    return Category::Uri;
  } else if constexpr (BeanType<T>) {
    return Category::Bean;
  } else if constexpr (StringType<T>) {
    return Category::String;
  } else if constexpr (MapType<T>) {
    return Category::Map;
  } else if constexpr (ByteArrayType<T>) {
    return Category::ByteArray;
  } else if constexpr (ArrayType<T>) {
    return Category::Array;
  } else if constexpr (CollectionType<T>) {
    return Category::Collection;
  } else if constexpr (ReaderType<T>) {
    return Category::Reader;
  } else if constexpr (InputStreamType<T>) {
    return Category::InputStream;
  } else {
    return Category::Other;
  }
}

template <typename T>
class TypedDescriptor final : public TypeDescriptor {
  static constexpr Category c = category_of<T>();

  static const T &cast(const void *o) { return *static_cast<const T *>(o); }

 public:
  Category category() const override { return c; }
  const std::type_info &type() const override { return typeid(T); }

  Value unwrap(const void *o) const override {
    if constexpr (c == Category::Any) {
      return cast(o);
    } else if constexpr (c == Category::Optional) {
      auto p = optional_traits<T>::get(cast(o));
      return p == nullptr ? Value() : Value::of(*p);
    } else {
      unsupported("unwrap");
    }
  }

  const TypeDescriptor &target() const override {
    if constexpr (c == Category::Optional) {
      return descriptor_of<typename optional_traits<T>::target_type>();
    } else {
      unsupported("target");
    }
  }

  bool is_null(const void *o) const override {
    if constexpr (c == Category::Char) {
      return cast(o) == T{};
    } else if constexpr (c == Category::String) {
      return string_traits<T>::null(cast(o));
    } else {
      return false;
    }
  }

  bool as_bool(const void *o) const override {
    if constexpr (c == Category::Boolean) {
      return cast(o);
    } else {
      unsupported("as_bool");
    }
  }

  Number as_number(const void *o) const override {
    if constexpr (c == Category::Integer && std::is_signed_v<T>) {
      return static_cast<int64_t>(cast(o));
    } else if constexpr (c == Category::Integer) {
      return static_cast<uint64_t>(cast(o));
    } else if constexpr (std::is_same_v<T, float>) {
      return cast(o);
    } else if constexpr (c == Category::Float) {
      return static_cast<double>(cast(o));
    } else {
      unsupported("as_number");
    }
  }

  std::optional<std::string> to_string(const void *o) const override {
    if constexpr (c == Category::String) {
      return to_utf8(string_traits<T>::view(cast(o)));
    } else if constexpr (std::is_same_v<T, char>) {
      return to_utf8(static_cast<char32_t>(static_cast<unsigned char>(cast(o))));
    } else if constexpr (c == Category::Char) {
      return to_utf8(static_cast<char32_t>(cast(o)));
    } else if constexpr (c == Category::Uri) {
      return cast(o).value;
    } else if constexpr (c == Category::Boolean) {
      return cast(o) ? "true" : "false";
    } else if constexpr (c == Category::Integer || c == Category::Float) {
      return std::format("{}", cast(o));
    } else if constexpr (Formattable<T>) {
      return std::format("{}", cast(o));
    } else if constexpr (Streamable<T>) {
      std::ostringstream out;
      out << cast(o);
      return std::move(out).str();
    } else if constexpr (std::is_enum_v<T>) {
      return std::to_string(gpk::to_underlying(cast(o)));
    } else {
      return std::nullopt;
    }
  }

  std::span<const std::byte> as_bytes(const void *o) const override {
    if constexpr (c == Category::ByteArray) {
      auto &t = cast(o);
      return std::as_bytes(std::span(std::ranges::data(t), std::ranges::size(t)));
    } else {
      unsupported("as_bytes");
    }
  }

  std::vector<std::pair<Value, Value>> entries(const void *o) const override {
    if constexpr (c == Category::Map) {
      std::vector<std::pair<Value, Value>> r;
      for (const auto &e : cast(o)) {
        r.emplace_back(Value::of(e.first), Value::of(e.second));
      }
      return r;
    } else {
      unsupported("entries");
    }
  }

  std::vector<Value> elements(const void *o) const override {
    if constexpr (c == Category::Collection || c == Category::Array) {
      using R = std::ranges::range_reference_t<const T>;
      std::vector<Value> r;
      for (auto &&e : cast(o)) {
        if constexpr (std::is_lvalue_reference_v<R>) {
          r.push_back(Value::of(e));
        } else {
          // proxies such as the elements of std::vector<bool>
          r.push_back(Value::own(std::ranges::range_value_t<const T>(e)));
        }
      }
      return r;
    } else {
      unsupported("elements");
    }
  }

  const TypeDescriptor &key_type() const override {
    if constexpr (c == Category::Map) {
      return descriptor_of<typename T::key_type>();
    } else {
      unsupported("key_type");
    }
  }

  const TypeDescriptor &element_type() const override {
    if constexpr (c == Category::Map) {
      return descriptor_of<typename T::mapped_type>();
    } else if constexpr (c == Category::Collection || c == Category::Array) {
      return descriptor_of<std::ranges::range_value_t<const T>>();
    } else {
      unsupported("element_type");
    }
  }

  void properties(const void *o, PropertyList &l) const override {
    if constexpr (c == Category::Bean && std::derived_from<T, PropertyEnumerable>) {
      cast(o).properties(l);
    } else if constexpr (c == Category::Bean) {
      BeanTraits<T>::properties(cast(o), l);
    } else {
      unsupported("properties");
    }
  }

  std::string_view bean_type_name(const void *o) const override {
    if constexpr (c == Category::Bean && std::derived_from<T, PropertyEnumerable>) {
      return cast(o).type_name();
    } else if constexpr (c == Category::Bean && requires(const T &t) { BeanTraits<T>::type_name(t); }) {
      return BeanTraits<T>::type_name(cast(o));
    } else {
      return {};
    }
  }

  std::istream &input_stream(const void *o) const override {
    if constexpr (c == Category::InputStream) {
      return const_cast<T &>(cast(o));
    } else {
      unsupported("input_stream");
    }
  }

  std::wistream &reader(const void *o) const override {
    if constexpr (c == Category::Reader) {
      return const_cast<T &>(cast(o));
    } else {
      unsupported("reader");
    }
  }
};

template <typename T>
const TypeDescriptor &descriptor_of() {
  using U = std::remove_cvref_t<T>;
  if constexpr (!std::is_same_v<T, U>) {
    return descriptor_of<U>();
  } else {
    static const TypedDescriptor<U> d;
    return d;
  }
}

template <typename T>
Value Value::own(T &&object) {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_same_v<U, Value>) {
    return std::forward<T>(object);
  } else if constexpr (std::is_array_v<U>) {
    static_assert(CharType<std::remove_extent_t<U>>, "only character arrays can be owned");
    return own(std::basic_string<std::remove_cv_t<std::remove_extent_t<U>>>(string_traits<U>::view(object)));
  } else {
    auto p = std::make_shared<U>(std::forward<T>(object));
    Value v = of(*p);
    v.owner = std::move(p);
    return v;
  }
}

template <typename T>
const T *Value::get() const {
  if (o == nullptr) {
    return nullptr;
  }
  if (t->type() == typeid(T)) {
    return static_cast<const T *>(o);
  }
  if (*id.type == typeid(T)) {
    return static_cast<const T *>(id.address);
  }
  return nullptr;
}

// Follows Any and Optional holders down to a concrete value, which stays alive as long as the result.
// declared is narrowed to the target type of the holders it names.
Value resolve(Value v, const TypeDescriptor *&declared);

}  // namespace gpk::codec

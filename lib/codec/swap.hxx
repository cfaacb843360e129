#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>

#include "codec/type_info.hxx"
#include "util/fatal.hxx"

namespace gpk::codec {

// One-hop replacement of a value by a surrogate.
class Swap {
 public:
  virtual ~Swap() = default;

  // declared type of the surrogate, descriptor_of<Value>() when only the surrogate itself knows it
  virtual const TypeDescriptor &swap_type() const = 0;
  virtual Value swap(const Value &v) const = 0;
};

template <typename T, typename S>
class TypedSwap : public Swap {
 public:
  const TypeDescriptor &swap_type() const override { return descriptor_of<S>(); }

  Value swap(const Value &v) const override {
    auto p = v.get<T>();
    if (p == nullptr) {
      die("Swap for {} applied to {}", type_name(typeid(T)), v.type().name());
    }
    return Value::own(to(*p));
  }

 protected:
  virtual S to(const T &t) const = 0;
};

// Swaps whose surrogate is a string.
template <typename T>
class StringSwap : public TypedSwap<T, std::string> {};

template <typename T, typename S>
class FunctionSwap final : public TypedSwap<T, S> {
 public:
  explicit FunctionSwap(std::function<S(const T &)> f_) : f(std::move(f_)) {}

 protected:
  S to(const T &t) const override { return f(t); }

 private:
  std::function<S(const T &)> f;
};

template <typename T, typename F>
std::shared_ptr<const Swap> make_swap(F &&f) {
  using S = std::remove_cvref_t<std::invoke_result_t<F, const T &>>;
  return std::make_shared<FunctionSwap<T, S>>(std::forward<F>(f));
}

// Swaps keyed by exact type, built before serializing and never changed during a walk.
class SwapRegistry {
 public:
  SwapRegistry() = default;
  ~SwapRegistry() = default;

  template <typename T>
  SwapRegistry &add(std::shared_ptr<const Swap> s) {
    return add(typeid(T), std::move(s));
  }
  SwapRegistry &add(const std::type_info &type, std::shared_ptr<const Swap> s);

  // looks the runtime type up first, then the static type of the handle
  const Swap *resolve(const Value &v) const;

  bool empty() const { return m.empty(); }
  size_t size() const { return m.size(); }

 private:
  const Swap *find(const std::type_info &type) const;

  std::unordered_map<std::type_index, std::shared_ptr<const Swap>> m;
};

}  // namespace gpk::codec

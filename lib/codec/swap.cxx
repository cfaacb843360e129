#include "codec/swap.hxx"

#include "util/fatal.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

SwapRegistry &SwapRegistry::add(const std::type_info &type, std::shared_ptr<const Swap> s) {
  if (s == nullptr) {
    die("Null swap for {}", type_name(type));
  }
  DEBUG("Register swap for {} to {}", type_name(type), s->swap_type().name());
  m[std::type_index(type)] = std::move(s);
  return *this;
}

const Swap *SwapRegistry::find(const std::type_info &type) const {
  if (auto it = m.find(std::type_index(type)); it != m.end()) {
    return it->second.get();
  }
  return nullptr;
}

const Swap *SwapRegistry::resolve(const Value &v) const {
  if (m.empty() || v.is_null()) {
    return nullptr;
  }
  if (auto s = find(*v.identity().type); s != nullptr) {
    return s;
  }
  return find(v.type().type());
}

}  // namespace gpk::codec

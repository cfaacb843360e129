#pragma once

#include <cassert>
#include <memory>

#include "memory/memory_region.hxx"
#include "util/logger.hxx"
#include "util/noncopyable.hxx"

namespace gpk {

// A non-owning view, usable as a zpp::bits byte view.
class LocalBuffer : public MemoryRegion {
 public:
  LocalBuffer() = default;
  LocalBuffer(uint8_t *base, size_t len) : MemoryRegion(base, len) {}
  ~LocalBuffer() = default;

  // for zpp_bits inner traits
  using value_type = uint8_t;

  uint8_t &operator[](size_t i) {
    assert(i < size());
    return data()[i];
  }
  uint8_t operator[](size_t i) const {
    assert(i < size());
    return data()[i];
  }
};

class OwnedBuffer : public LocalBuffer, Noncopyable, Nonmovable {
 public:
  explicit OwnedBuffer(size_t size) : LocalBuffer(new uint8_t[size], size) {
    TRACE("Owned buffer at {} with length {}", (void *)base, len);
  }
  ~OwnedBuffer() { delete[] data(); }

  LocalBuffer borrow() { return LocalBuffer(data(), size()); }
};

}  // namespace gpk

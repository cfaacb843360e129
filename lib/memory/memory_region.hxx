#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "util/hex_dump.hxx"

namespace gpk {

class MemoryRegion {
 public:
  MemoryRegion() = default;
  MemoryRegion(uint8_t *base_, size_t len_) : base(base_), len(len_) {}
  ~MemoryRegion() = default;

  uint8_t *data() { return base; }
  const uint8_t *data() const { return base; }
  size_t size() const { return len; }

  bool empty() const { return base == nullptr && len == 0; }

  std::span<const std::byte> bytes(size_t n) const { return {reinterpret_cast<const std::byte *>(base), n}; }

  operator Hexdump() const { return Hexdump(data(), size()); }
  operator std::string_view() const { return std::string_view(reinterpret_cast<const char *>(data()), size()); }
  operator std::span<const std::byte>() const { return bytes(len); }

 protected:
  uint8_t *base = nullptr;
  size_t len = 0;
};

}  // namespace gpk

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "codec/type_info.hxx"
#include "codec/value.hxx"
#include "util/noncopyable.hxx"

template <>
struct std::hash<gpk::codec::Identity> {
  size_t operator()(const gpk::codec::Identity &id) const noexcept {
    return std::hash<const void *>{}(id.address) ^ id.type->hash_code();
  }
};

namespace gpk::codec {

// Tracks the containers and beans on the current descent path.
class RecursionGuard : Noncopyable, Nonmovable {
  struct Entry {
    std::string attr;
    Identity id;
    const TypeDescriptor *type;
  };

 public:
  // Scoped membership of one value in the path, released on every exit.
  class Frame : Noncopyable {
   public:
    Frame(Frame &&other) noexcept : g(std::exchange(other.g, nullptr)) {}
    Frame &operator=(Frame &&) = delete;

    // false for a value that is not on the path
    bool active() const { return g != nullptr; }
    ~Frame() {
      if (g != nullptr) {
        g->exit();
      }
    }

   private:
    friend class RecursionGuard;
    explicit Frame(RecursionGuard *g_) : g(g_) {}

    RecursionGuard *g;
  };

  explicit RecursionGuard(size_t max_depth_) : max_depth(max_depth_) {}
  ~RecursionGuard() = default;

  // Pushes a bean or container; other values get an empty frame. nullopt when the value is already on the
  // path; throws DepthExceededError when the path would grow past max_depth.
  std::optional<Frame> enter(std::string_view attr, const Value &v);

  bool would_recurse(const Value &v) const;

  size_t depth() const { return stack.size(); }

  // e.g. "root/<iterator>/children"
  std::string path() const;

 private:
  void exit();

  size_t max_depth;
  std::vector<Entry> stack;
  std::unordered_set<Identity> on_path;
};

}  // namespace gpk::codec

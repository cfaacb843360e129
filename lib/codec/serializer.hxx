#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "codec/graph_walker.hxx"
#include "codec/options.hxx"
#include "codec/orderer.hxx"
#include "codec/sink.hxx"
#include "codec/swap.hxx"
#include "codec/uri.hxx"
#include "util/noncopyable.hxx"

namespace gpk::codec {

// Serializer configuration and entry points. Reusable sequentially, each call walks with fresh state.
class Serializer : Noncopyable {
 public:
  explicit Serializer(Options o_ = {}, SwapRegistry swaps_ = {});
  ~Serializer() = default;

  Serializer &set_uri_resolver(std::shared_ptr<const UriResolver> r);
  Serializer &set_comparator(Comparator less);
  // called in addition to the warning being recorded
  Serializer &set_getter_error_handler(GetterErrorHandler h);

  template <typename T>
  size_t serialize(const T &root, Sink &out) {
    return serialize(Value::of(root), out);
  }
  size_t serialize(const Value &root, Sink &out);

  template <typename T>
  std::vector<std::byte> serialize_to_bytes(const T &root) {
    return serialize_to_bytes(Value::of(root));
  }
  std::vector<std::byte> serialize_to_bytes(const Value &root);

  // encoded in the configured binary format
  template <typename T>
  std::string serialize_to_string(const T &root) {
    return serialize_to_string(Value::of(root));
  }
  std::string serialize_to_string(const Value &root);

  const Options &options() const { return o; }
  const SwapRegistry &swaps() const { return s; }
  // property read failures of the last call
  const std::vector<std::string> &warnings() const { return w; }

 private:
  Options o;
  SwapRegistry s;
  std::shared_ptr<const UriResolver> uris;
  Comparator less = natural_less;
  GetterErrorHandler on_getter_error;
  std::vector<std::string> w;
};

}  // namespace gpk::codec

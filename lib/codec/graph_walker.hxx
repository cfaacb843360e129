#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <string_view>

#include "codec/bean.hxx"
#include "codec/encoder.hxx"
#include "codec/options.hxx"
#include "codec/orderer.hxx"
#include "codec/recursion_guard.hxx"
#include "codec/swap.hxx"
#include "codec/type_info.hxx"
#include "codec/uri.hxx"
#include "util/noncopyable.hxx"

namespace gpk::codec {

struct GetterError {
  std::string path;
  std::string property;
  std::string bean_type;
  std::string message;
  std::exception_ptr error;
};

// Receives a bean property whose accessor raised; the property is left out of the output.
using GetterErrorHandler = std::function<void(const GetterError &)>;

// Collaborators of one walk, all owned by the caller.
struct WalkContext {
  const Options &o;
  const SwapRegistry &swaps;
  const UriResolver &uris;
  const CollectionOrderer &orderer;
  const GetterErrorHandler &on_getter_error;
};

// Depth-first encoder of one object graph. One instance per top-level call.
class GraphWalker : Noncopyable, Nonmovable {
 public:
  // returns the number of bytes handed to the sink
  static size_t walk(const Value &root, const TypeDescriptor &expected, const WalkContext &ctx, Sink &sink);

 private:
  GraphWalker(const WalkContext &ctx_, Sink &sink)
      : ctx(ctx_), g(ctx.o.max_depth), enc(sink, ctx.o.buffer_size) {}
  ~GraphWalker() = default;

  void encode(Value v, const TypeDescriptor *declared, std::string_view attr, const PropertyValue *p,
              bool allow_swap = true);
  void dispatch(const Value &v, Kind kind, const std::string &type_name);
  void encode_bean(const Value &v, const std::string &type_name);
  void encode_map(const Value &v);
  void encode_collection(const Value &v);
  void encode_text(const Value &v, bool trim);
  void encode_uri(const Value &v);

  std::string bean_type_name(const Value &v, const TypeDescriptor &declared) const;
  bool will_recurse(const PropertyValue &p) const;
  Value generalize(Value key, const TypeDescriptor &key_type) const;
  std::string text_of(const Value &v) const;
  void report(const Value &bean, const PropertyValue &p);

  const WalkContext &ctx;
  RecursionGuard g;
  BinaryEncoder enc;
};

}  // namespace gpk::codec

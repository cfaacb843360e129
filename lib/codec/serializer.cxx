#include "codec/serializer.hxx"

#include "codec/swaps/temporal_swap.hxx"
#include "util/fatal.hxx"
#include "util/hex_dump.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

Serializer::Serializer(Options o_, SwapRegistry swaps_) : o(std::move(o_)), s(std::move(swaps_)) {
  o.validate();
  DEBUG("graphpack options: {}", o.to_json(true));
  uris = std::make_shared<ContextUriResolver>(o.uri_context, o.resolution(), o.relativity());
  if (auto f = o.temporal_format(); f.has_value()) {
    s.add<std::chrono::system_clock::time_point>(std::make_shared<TemporalSwap>(*f));
  }
}

Serializer &Serializer::set_uri_resolver(std::shared_ptr<const UriResolver> r) {
  if (r == nullptr) {
    die("Null uri resolver");
  }
  uris = std::move(r);
  return *this;
}

Serializer &Serializer::set_comparator(Comparator less_) {
  if (!less_) {
    die("Empty comparator");
  }
  less = std::move(less_);
  return *this;
}

Serializer &Serializer::set_getter_error_handler(GetterErrorHandler h) {
  on_getter_error = std::move(h);
  return *this;
}

size_t Serializer::serialize(const Value &root, Sink &out) {
  w.clear();
  CollectionOrderer orderer(o.sort_maps, o.sort_collections, less);
  GetterErrorHandler record = [this](const GetterError &e) {
    WARN("Could not call getter of {} on {} at {}: {}", e.property, e.bean_type, e.path, e.message);
    w.push_back(std::format("{}: {}: {}", e.path, e.property, e.message));
    if (on_getter_error) {
      on_getter_error(e);
    }
  };
  WalkContext ctx{o, s, *uris, orderer, record};

  // the root's own type is expected unless its type name is asked for
  auto declared = &descriptor_of<Value>();
  auto resolved = resolve(root, declared);
  auto &expected = (o.add_root_type || resolved.is_null()) ? descriptor_of<Value>() : resolved.type();

  auto n = GraphWalker::walk(resolved, expected, ctx, out);
  out.finish();
  DEBUG("Serialized {} bytes with {} warnings", n, w.size());
  return n;
}

std::vector<std::byte> Serializer::serialize_to_bytes(const Value &root) {
  VectorSink out;
  serialize(root, out);
  TRACE("{}", Hexdump(out.bytes()));
  return out.take();
}

std::string Serializer::serialize_to_string(const Value &root) {
  StringSink out;
  switch (o.format()) {
    case BinaryFormat::Binary:
      serialize(root, out);
      break;
    case BinaryFormat::Hex: {
      HexSink hex(out);
      serialize(root, hex);
      break;
    }
    case BinaryFormat::SpacedHex: {
      HexSink hex(out, true);
      serialize(root, hex);
      break;
    }
    case BinaryFormat::Base64: {
      Base64Sink base64(out);
      serialize(root, base64);
      break;
    }
  }
  return out.take();
}

}  // namespace gpk::codec

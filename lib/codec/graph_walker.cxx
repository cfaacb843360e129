#include "codec/graph_walker.hxx"

#include <cctype>
#include <exception>

#include "codec/classifier.hxx"
#include "codec/errors.hxx"
#include "util/logger.hxx"

namespace gpk::codec {

namespace {

constexpr std::string_view iterator_attr = "<iterator>";

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

std::string message_of(const std::exception_ptr &e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace

size_t GraphWalker::walk(const Value &root, const TypeDescriptor &expected, const WalkContext &ctx, Sink &sink) {
  GraphWalker w(ctx, sink);
  TRACE("Walk {} as {}", root.is_null() ? "null" : root.type().name(), expected.name());
  w.encode(root, &expected, "root", nullptr);
  w.enc.flush();
  TRACE("End walk, {} bytes", w.enc.written());
  return w.enc.written();
}

void GraphWalker::encode(Value v, const TypeDescriptor *declared, std::string_view attr, const PropertyValue *p,
                         bool allow_swap) {
  v = resolve(std::move(v), declared);
  if (v.is_null()) {
    enc.append_null();
    return;
  }

  auto frame = g.enter(attr, v);
  if (!frame.has_value()) {
    enc.append_null();
    return;
  }

  std::string type_name;
  if (v.type().category() == Category::Bean) {
    type_name = bean_type_name(v, *declared);
  }

  if (auto s = allow_swap ? ctx.swaps.resolve(v) : nullptr; s != nullptr) {
    TRACE("Swap {} at {} to {}", v.type().name(), attr, s->swap_type().name());
    auto swapped = s->swap(v);
    swapped.keep_alive(v);
    declared = &s->swap_type();
    v = resolve(std::move(swapped), declared);
  }

  auto kind = ValueClassifier::classify(v, p != nullptr && p->uri);
  TRACE("Encode {} of {} at depth {}", kind, v.is_null() ? "null" : v.type().name(), g.depth());
  try {
    dispatch(v, kind, type_name);
  } catch (const UnsupportedValueError &e) {
    if (!e.path().empty()) {
      throw;
    }
    auto where = g.path();
    if (!frame->active() && !attr.empty()) {
      where += where.empty() ? std::string(attr) : "/" + std::string(attr);
    }
    throw UnsupportedValueError(e.why(), e.type_name(), where);
  }
}

void GraphWalker::dispatch(const Value &v, Kind kind, const std::string &type_name) {
  switch (kind) {
    case Kind::Null:
      enc.append_null();
      break;
    case Kind::Boolean:
      enc.append_boolean(v.type().as_bool(v.object()));
      break;
    case Kind::Number:
      enc.append_number(v.type().as_number(v.object()));
      break;
    case Kind::Bean:
      encode_bean(v, type_name);
      break;
    case Kind::Uri:
      encode_uri(v);
      break;
    case Kind::Map:
      encode_map(v);
      break;
    case Kind::Collection:
    case Kind::Array:
      encode_collection(v);
      break;
    case Kind::ByteArray:
      enc.append_binary(v.type().as_bytes(v.object()));
      break;
    case Kind::Reader:
      enc.pipe(v.type().reader(v.object()));
      break;
    case Kind::InputStream:
      enc.pipe(v.type().input_stream(v.object()));
      break;
    case Kind::String:
    case Kind::Other:
      encode_text(v, ctx.o.trim_strings);
      break;
  }
}

void GraphWalker::encode_bean(const Value &v, const std::string &type_name) {
  auto keep_null = ctx.o.keep_null_properties;
  auto values = BeanPropertyEnumerator::enumerate(v, keep_null, ctx.o.bean_type_property_name, type_name);

  std::vector<bool> skip(values.size(), false);
  auto n = values.size();
  for (auto i = 0uz; i < values.size(); ++i) {
    auto &p = values[i];
    if (p.thrown != nullptr || (!keep_null && will_recurse(p))) {
      skip[i] = true;
      --n;
    }
  }

  enc.start_map(n);
  for (auto i = 0uz; i < values.size(); ++i) {
    auto &p = values[i];
    if (p.thrown != nullptr) {
      report(v, p);
      continue;
    }
    if (skip[i]) {
      TRACE("Skip recursive property {} at {}", p.name, g.path());
      continue;
    }
    enc.append_string(ctx.o.trim_strings ? trim(p.name) : std::string_view(p.name));
    encode(p.value, p.declared, p.name, &p);
  }
}

void GraphWalker::encode_map(const Value &v) {
  auto entries = ctx.orderer.entries(v);
  auto &key_type = v.type().key_type();
  auto &value_type = v.type().element_type();
  enc.start_map(entries.size());
  for (auto &[key, value] : entries) {
    auto k = generalize(std::move(key), key_type);
    encode(std::move(k), &key_type, "", nullptr, false);
    encode(std::move(value), &value_type, "", nullptr);
  }
}

void GraphWalker::encode_collection(const Value &v) {
  auto elements = ctx.orderer.elements(v);
  auto &element_type = v.type().element_type();
  enc.start_array(elements.size());
  for (auto &e : elements) {
    encode(std::move(e), &element_type, iterator_attr, nullptr);
  }
}

void GraphWalker::encode_text(const Value &v, bool trim_text) {
  auto s = text_of(v);
  enc.append_string(trim_text ? trim(s) : std::string_view(s));
}

void GraphWalker::encode_uri(const Value &v) { enc.append_string(ctx.uris.resolve(text_of(v))); }

std::string GraphWalker::text_of(const Value &v) const {
  auto s = v.type().to_string(v.object());
  if (!s.has_value()) {
    throw UnsupportedValueError("no string form", v.type().name(), "");
  }
  return std::move(s).value();
}

// A type name is written when the runtime type is not the declared one and the policy asks for it.
std::string GraphWalker::bean_type_name(const Value &v, const TypeDescriptor &declared) const {
  auto root = g.depth() == 1;
  if (!(ctx.o.add_bean_types || (root && ctx.o.add_root_type))) {
    return {};
  }
  if (declared.type() == *v.identity().type) {
    return {};
  }
  return std::string(v.type().bean_type_name(v.object()));
}

bool GraphWalker::will_recurse(const PropertyValue &p) const {
  auto declared = p.declared;
  return g.would_recurse(resolve(p.value, declared));
}

// Applies the swap of the key, then turns it into a string when the map declares string keys.
Value GraphWalker::generalize(Value key, const TypeDescriptor &key_type) const {
  auto declared = &key_type;
  key = resolve(std::move(key), declared);
  if (key.is_null()) {
    return key;
  }
  if (auto s = ctx.swaps.resolve(key); s != nullptr) {
    auto swapped = s->swap(key);
    swapped.keep_alive(key);
    key = resolve(std::move(swapped), declared);
    if (key.is_null()) {
      return key;
    }
  }
  if (declared->category() == Category::String && key.type().category() != Category::String) {
    auto text = text_of(key);
    return Value::own(ctx.o.trim_strings ? std::string(trim(text)) : std::move(text));
  }
  return key;
}

void GraphWalker::report(const Value &bean, const PropertyValue &p) {
  GetterError e{g.path(), p.name, bean.type().name(), message_of(p.thrown), p.thrown};
  if (ctx.on_getter_error) {
    ctx.on_getter_error(e);
  } else {
    WARN("Could not call getter of {} on {} at {}: {}", e.property, e.bean_type, e.path, e.message);
  }
}

}  // namespace gpk::codec

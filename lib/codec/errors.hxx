#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace gpk::codec {

// Fatal conditions of a walk. The path names the chain of containers being encoded when it happened.
class SerializeError : public std::runtime_error {
 public:
  SerializeError(const std::string &what, std::string path_) : std::runtime_error(what), p(std::move(path_)) {}

  const std::string &path() const { return p; }

 private:
  std::string p;
};

class DepthExceededError : public SerializeError {
 public:
  DepthExceededError(size_t max_depth, std::string path)
      : SerializeError("Depth too deep, max depth " + std::to_string(max_depth) + " exceeded at " + path,
                       std::move(path)) {}
};

class UnsupportedValueError : public SerializeError {
 public:
  UnsupportedValueError(std::string why_, std::string type_name_, std::string path)
      : SerializeError("Unsupported value of type " + type_name_ + ": " + why_ + " at " + path, std::move(path)),
        w(std::move(why_)),
        t(std::move(type_name_)) {}

  const std::string &why() const { return w; }
  const std::string &type_name() const { return t; }

 private:
  std::string w;
  std::string t;
};

// Raised by sinks; the walker never catches it.
class TransportError : public std::system_error {
 public:
  TransportError(int ev, const std::string &what) : std::system_error(ev, std::generic_category(), what) {}
  explicit TransportError(const std::string &what)
      : std::system_error(std::make_error_code(std::errc::io_error), what) {}
};

class DecodeError : public std::runtime_error {
 public:
  DecodeError(const std::string &what, size_t offset_)
      : std::runtime_error(what + " at offset " + std::to_string(offset_)), off(offset_) {}

  size_t offset() const { return off; }

 private:
  size_t off;
};

}  // namespace gpk::codec

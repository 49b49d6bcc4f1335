#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kinship::util {

/*
  Central error types.

  Callers translate these into client or server errors with Classify().
*/

class PersonNotFound : public std::runtime_error {
 public:
  explicit PersonNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Upstream data corruption: an edge set the normalizer cannot interpret.
class MalformedEdge : public std::runtime_error {
 public:
  explicit MalformedEdge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidDepthMode : public std::runtime_error {
 public:
  explicit InvalidDepthMode(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidFilter : public std::runtime_error {
 public:
  explicit InvalidFilter(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ErrorClass {
  kClient,
  kServer,
};

ErrorClass Classify(const std::exception& e);

constexpr std::string_view ToString(ErrorClass error_class) {
  return error_class == ErrorClass::kClient ? "client" : "server";
}

} // namespace kinship::util

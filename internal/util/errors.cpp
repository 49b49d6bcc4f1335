#include "internal/util/errors.hpp"

namespace kinship::util {

ErrorClass Classify(const std::exception& e) {
  if (dynamic_cast<const PersonNotFound*>(&e)) {
    return ErrorClass::kClient;
  }
  if (dynamic_cast<const InvalidDepthMode*>(&e)) {
    return ErrorClass::kClient;
  }
  if (dynamic_cast<const InvalidFilter*>(&e)) {
    return ErrorClass::kClient;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return ErrorClass::kClient;
  }

  // MalformedEdge and anything unexpected are the server's fault.
  return ErrorClass::kServer;
}

} // namespace kinship::util

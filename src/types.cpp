#include <format>

#include <flatdata/types.hpp>

namespace flatdata {

ResourceStorageError ResourceStorageError::io(std::string resourceName, std::string message) {
  return make(ErrorKind::Io, std::move(resourceName), std::move(message));
}

ResourceStorageError ResourceStorageError::make(ErrorKind kind, std::string resourceName,
                                                std::string message) {
  ResourceStorageError error;
  error.kind = kind;
  error.resourceName = std::move(resourceName);
  error.message = std::move(message);
  return error;
}

ResourceStorageError ResourceStorageError::wrongSignature(std::string resourceName,
                                                          std::string diff) {
  ResourceStorageError error = make(ErrorKind::WrongSignature, std::move(resourceName));
  error.diff = std::move(diff);
  return error;
}

ResourceStorageError ResourceStorageError::tooBig(std::string resourceName, size_t size) {
  ResourceStorageError error = make(ErrorKind::TooBig, std::move(resourceName));
  error.size = size;
  return error;
}

std::string ResourceStorageError::toString() const {
  std::string result = std::format("{} [{}]", description(kind), resourceName);
  if (kind == ErrorKind::TooBig) {
    result += std::format(" size={}", size);
  }
  if (!message.empty()) {
    result += ": " + message;
  }
  if (!diff.empty()) {
    result += "\n" + diff;
  }
  return result;
}

const char *description(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "resource io error";
  case ErrorKind::Utf8Error:
    return "utf8 error in schema";
  case ErrorKind::MissingSchema:
    return "schema of resource is missing";
  case ErrorKind::MissingData:
    return "resource has partially missing data";
  case ErrorKind::WrongSignature:
    return "schema is not matching expected schema";
  case ErrorKind::UnexpectedDataSize:
    return "resource has unexpected size";
  case ErrorKind::TooBig:
    return "resource is too big";
  case ErrorKind::Missing:
    return "missing resource or archive";
  }
  return "unknown error";
}

} // namespace flatdata

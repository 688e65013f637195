#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace flatdata {

// Every stored resource is followed by this many zero bytes, so the bit codec
// may touch up to 8 bytes past the last field of the last element.
inline constexpr size_t PADDING_SIZE = 8;

// Size of the little-endian u64 size header in front of every stored resource
inline constexpr size_t SIZE_HEADER = 8;

enum class ErrorKind {
  Io,                 // I/O failure, tagged with the resource name
  Utf8Error,          // Schema bytes are not valid UTF-8
  MissingSchema,      // No schema stored for the resource
  MissingData,        // Part of a multi-part resource is missing (e.g. multivector index)
  WrongSignature,     // Stored schema differs from the expected one
  UnexpectedDataSize, // Blob length disagrees with the recorded size header
  TooBig,             // Value does not fit the bit width of an index/reference field
  Missing,            // Resource or archive is missing completely
};

// Error reported by resource storage, vectors and archives
struct ResourceStorageError {
  ErrorKind kind = ErrorKind::Io;
  std::string resourceName;
  std::string message; // Free-form detail (e.g. errno text)
  std::string diff;    // Only for WrongSignature
  size_t size = 0;     // Only for TooBig

  static ResourceStorageError io(std::string resourceName, std::string message);
  static ResourceStorageError make(ErrorKind kind, std::string resourceName,
                                   std::string message = {});
  static ResourceStorageError wrongSignature(std::string resourceName, std::string diff);
  static ResourceStorageError tooBig(std::string resourceName, size_t size);

  // Io is the only kind a storage backend might succeed on when retried
  bool isRetryable() const { return kind == ErrorKind::Io; }

  std::string toString() const;
};

// Static description of an error kind
const char *description(ErrorKind kind);

// Assign error to outError if provided; always returns false for use in return statements
inline bool fail(ResourceStorageError *outError, ResourceStorageError error) {
  if (outError) {
    *outError = std::move(error);
  }
  return false;
}

// Exception for structurally corrupt data discovered while reading
class CorruptDataError : public std::runtime_error {
public:
  explicit CorruptDataError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace flatdata

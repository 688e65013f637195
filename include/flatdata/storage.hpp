#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace flatdata {

// Named, schema-tagged byte blob store.
//
// Each resource `name` is kept as two blobs: `name` holding the framed payload
// ([u64 LE size][data][PADDING_SIZE zero bytes]) and `name.schema` holding the
// schema text. Backends only implement the blob primitives below; framing,
// schema checks and error classification live here.
//
// Single-threaded contract: a storage may be shared by several builders, but at
// most one write may be in flight at a time. A re-entrant write throws
// std::logic_error. Spans returned by read() borrow storage-owned memory and are
// valid until the resource is rewritten or the storage is destroyed.
class ResourceStorage {
public:
  virtual ~ResourceStorage() = default;

  ResourceStorage(const ResourceStorage &) = delete;
  ResourceStorage &operator=(const ResourceStorage &) = delete;

  // True if the resource payload exists
  bool exists(const std::string &name) const;

  // Read resource data and check its stored schema against expectedSchema.
  // The returned span excludes size header and padding; PADDING_SIZE readable
  // bytes follow it.
  std::optional<std::span<const uint8_t>> read(const std::string &name,
                                               std::string_view expectedSchema,
                                               ResourceStorageError *outError = nullptr);

  // Read the stored schema text without comparing it
  std::optional<std::string> readSchema(const std::string &name,
                                        ResourceStorageError *outError = nullptr);

  // Persist data and schema of a resource. The old schema is dropped before the
  // data is replaced, so a write failing halfway leaves the resource unreadable
  // (MissingSchema) rather than paired with a schema it no longer matches.
  // Errors are tagged with the resource name.
  bool write(const std::string &name, std::string_view schema, std::span<const uint8_t> data,
             ResourceStorageError *outError = nullptr);

  static std::string schemaKey(const std::string &name) { return name + ".schema"; }

protected:
  ResourceStorage() = default;

  virtual bool blobExists(const std::string &key) const = 0;

  // Returns std::nullopt with an Io error on failure
  virtual std::optional<std::span<const uint8_t>> readBlob(const std::string &key,
                                                           ResourceStorageError *outError) = 0;

  // Store the concatenation of parts under key
  virtual bool writeBlob(const std::string &key, std::span<const std::span<const uint8_t>> parts,
                         ResourceStorageError *outError) = 0;

  virtual bool removeBlob(const std::string &key, ResourceStorageError *outError) = 0;

  // Asked for every blob of a resource before any of them is touched by write()
  virtual bool canReplaceBlob(const std::string &key, std::string *reason) const {
    (void)key;
    (void)reason;
    return true;
  }

private:
  bool writing_ = false;
};

} // namespace flatdata

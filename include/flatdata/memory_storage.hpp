#pragma once

#include <map>
#include <string>
#include <vector>

#include "storage.hpp"

namespace flatdata {

// Keeps every blob in memory. Rewriting a name replaces the blob and
// invalidates spans previously read from it.
class MemoryResourceStorage : public ResourceStorage {
public:
  MemoryResourceStorage() = default;

  // Names of all stored resources (schema blobs excluded), sorted
  std::vector<std::string> resourceNames() const;

  // Raw framed blob, for inspection in tests; nullptr if absent
  const std::vector<uint8_t> *blob(const std::string &key) const;

  // Replace a raw blob without framing, e.g. to simulate damaged data
  void putBlob(const std::string &key, std::vector<uint8_t> bytes);
  void eraseBlob(const std::string &key);

protected:
  bool blobExists(const std::string &key) const override;
  std::optional<std::span<const uint8_t>> readBlob(const std::string &key,
                                                   ResourceStorageError *outError) override;
  bool writeBlob(const std::string &key, std::span<const std::span<const uint8_t>> parts,
                 ResourceStorageError *outError) override;
  bool removeBlob(const std::string &key, ResourceStorageError *outError) override;

private:
  std::map<std::string, std::vector<uint8_t>> blobs_;
};

} // namespace flatdata

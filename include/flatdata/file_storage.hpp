#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

#include "storage.hpp"

namespace flatdata {

// One file per blob inside a directory: `dir/name` and `dir/name.schema`.
// Reads are memory-mapped (POSIX) and the mappings are kept for the lifetime of
// the storage, so spans returned by read() stay valid. A resource with a mapped
// blob cannot be rewritten.
class FileResourceStorage : public ResourceStorage {
public:
  explicit FileResourceStorage(std::filesystem::path directory);
  ~FileResourceStorage() override;

  const std::filesystem::path &directory() const { return directory_; }

  // Number of blobs currently mapped
  size_t mappedBlobs() const { return mapped_.size(); }

protected:
  bool blobExists(const std::string &key) const override;
  std::optional<std::span<const uint8_t>> readBlob(const std::string &key,
                                                   ResourceStorageError *outError) override;
  bool writeBlob(const std::string &key, std::span<const std::span<const uint8_t>> parts,
                 ResourceStorageError *outError) override;
  bool removeBlob(const std::string &key, ResourceStorageError *outError) override;
  bool canReplaceBlob(const std::string &key, std::string *reason) const override;

private:
  class Mapping;

  std::filesystem::path directory_;
  std::unordered_map<std::string, std::unique_ptr<Mapping>> mapped_;
};

} // namespace flatdata

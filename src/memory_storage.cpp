#include <flatdata/memory_storage.hpp>

namespace flatdata {

std::vector<std::string> MemoryResourceStorage::resourceNames() const {
  static const std::string suffix = ".schema";
  std::vector<std::string> names;
  for (const auto &[key, bytes] : blobs_) {
    bool isSchema = key.size() > suffix.size() &&
                    key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
    if (!isSchema) {
      names.push_back(key);
    }
  }
  return names;
}

const std::vector<uint8_t> *MemoryResourceStorage::blob(const std::string &key) const {
  auto it = blobs_.find(key);
  return it == blobs_.end() ? nullptr : &it->second;
}

void MemoryResourceStorage::putBlob(const std::string &key, std::vector<uint8_t> bytes) {
  blobs_[key] = std::move(bytes);
}

void MemoryResourceStorage::eraseBlob(const std::string &key) {
  blobs_.erase(key);
}

bool MemoryResourceStorage::blobExists(const std::string &key) const {
  return blobs_.find(key) != blobs_.end();
}

std::optional<std::span<const uint8_t>>
MemoryResourceStorage::readBlob(const std::string &key, ResourceStorageError *outError) {
  auto it = blobs_.find(key);
  if (it == blobs_.end()) {
    fail(outError, ResourceStorageError::io(key, "no such blob"));
    return std::nullopt;
  }
  return std::span<const uint8_t>(it->second);
}

bool MemoryResourceStorage::writeBlob(const std::string &key,
                                      std::span<const std::span<const uint8_t>> parts,
                                      ResourceStorageError *) {
  std::vector<uint8_t> bytes;
  size_t total = 0;
  for (const auto &part : parts) {
    total += part.size();
  }
  bytes.reserve(total);
  for (const auto &part : parts) {
    bytes.insert(bytes.end(), part.begin(), part.end());
  }
  blobs_[key] = std::move(bytes);
  return true;
}

bool MemoryResourceStorage::removeBlob(const std::string &key, ResourceStorageError *) {
  blobs_.erase(key);
  return true;
}

} // namespace flatdata

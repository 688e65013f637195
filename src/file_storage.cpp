#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <flatdata/file_storage.hpp>
#include <flatdata/log.hpp>

namespace flatdata {

// Read-only private mapping of one blob file. The descriptor is closed right
// after mapping; empty files are represented without a mapping.
class FileResourceStorage::Mapping {
public:
  static std::unique_ptr<Mapping> map(const std::filesystem::path &path, std::string *outError) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      *outError = std::format("Failed to open {}: {}", path.string(), std::strerror(errno));
      return nullptr;
    }

    struct stat st;
    if (::fstat(fd, &st) < 0) {
      *outError = std::format("Failed to stat {}: {}", path.string(), std::strerror(errno));
      ::close(fd);
      return nullptr;
    }

    size_t size = static_cast<size_t>(st.st_size);
    void *data = nullptr;
    if (size > 0) {
      data = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
      if (data == MAP_FAILED) {
        *outError = std::format("Failed to map {}: {}", path.string(), std::strerror(errno));
        ::close(fd);
        return nullptr;
      }
    }
    ::close(fd);
    return std::unique_ptr<Mapping>(new Mapping(data, size));
  }

  ~Mapping() {
    if (data_) {
      ::munmap(data_, size_);
    }
  }

  Mapping(const Mapping &) = delete;
  Mapping &operator=(const Mapping &) = delete;

  std::span<const uint8_t> bytes() const {
    return {static_cast<const uint8_t *>(data_), size_};
  }

private:
  Mapping(void *data, size_t size) : data_(data), size_(size) {}

  void *data_;
  size_t size_;
};

FileResourceStorage::FileResourceStorage(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

FileResourceStorage::~FileResourceStorage() = default;

bool FileResourceStorage::blobExists(const std::string &key) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(directory_ / key, ec);
}

std::optional<std::span<const uint8_t>>
FileResourceStorage::readBlob(const std::string &key, ResourceStorageError *outError) {
  if (auto it = mapped_.find(key); it != mapped_.end()) {
    return it->second->bytes();
  }

  std::string error;
  auto mapping = Mapping::map(directory_ / key, &error);
  if (!mapping) {
    fail(outError, ResourceStorageError::io(key, std::move(error)));
    return std::nullopt;
  }

  logger().trace("mapped blob {} ({} bytes)", key, mapping->bytes().size());
  auto [it, inserted] = mapped_.emplace(key, std::move(mapping));
  return it->second->bytes();
}

bool FileResourceStorage::canReplaceBlob(const std::string &key, std::string *reason) const {
  if (mapped_.find(key) != mapped_.end()) {
    *reason = std::format("cannot rewrite {}, it is mapped by a reader", key);
    return false;
  }
  return true;
}

bool FileResourceStorage::writeBlob(const std::string &key,
                                    std::span<const std::span<const uint8_t>> parts,
                                    ResourceStorageError *outError) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return fail(outError,
                ResourceStorageError::io(key, std::format("Failed to create directory {}: {}",
                                                          directory_.string(), ec.message())));
  }

  std::filesystem::path path = directory_ / key;
  std::filesystem::path tempPath = path;
  tempPath += ".tmp";

  {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(outError, ResourceStorageError::io(
                                key, std::format("Failed to create {}", tempPath.string())));
    }
    for (const auto &part : parts) {
      out.write(reinterpret_cast<const char *>(part.data()),
                static_cast<std::streamsize>(part.size()));
    }
    out.flush();
    if (!out) {
      return fail(outError, ResourceStorageError::io(
                                key, std::format("Failed to write {}", tempPath.string())));
    }
  }

  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    std::string message = std::format("Failed to move {} into place: {}", path.string(),
                                      ec.message());
    std::filesystem::remove(tempPath, ec);
    return fail(outError, ResourceStorageError::io(key, std::move(message)));
  }

  logger().trace("stored blob {}", path.string());
  return true;
}

bool FileResourceStorage::removeBlob(const std::string &key, ResourceStorageError *outError) {
  std::error_code ec;
  std::filesystem::remove(directory_ / key, ec);
  if (ec) {
    return fail(outError, ResourceStorageError::io(
                              key, std::format("Failed to remove {}: {}",
                                               (directory_ / key).string(), ec.message())));
  }
  return true;
}

} // namespace flatdata

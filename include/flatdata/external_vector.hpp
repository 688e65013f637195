#pragma once

#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "log.hpp"
#include "storage.hpp"
#include "vector.hpp"

namespace flatdata {

// Append-only sequence of records streamed into one resource.
// Records accumulate in a growth buffer and are written exactly once by close();
// a vector that is still open when destroyed is closed by its destructor.
template <StructType T> class ExternalVector {
public:
  ExternalVector(std::shared_ptr<ResourceStorage> storage, std::string name, std::string schema)
      : storage_(std::move(storage)), name_(std::move(name)), schema_(std::move(schema)) {}

  ~ExternalVector() {
    if (!storage_ || closed_) {
      return;
    }
    logger().warn("external vector {} was not closed, closing it on destruction", name_);
    ResourceStorageError error;
    if (!close(&error)) {
      logger().error("failed to close external vector {}: {}", name_, error.toString());
    }
  }

  // Delete copy, enable move
  ExternalVector(const ExternalVector &) = delete;
  ExternalVector &operator=(const ExternalVector &) = delete;
  ExternalVector(ExternalVector &&other) noexcept
      : storage_(std::move(other.storage_)), name_(std::move(other.name_)),
        schema_(std::move(other.schema_)), buffer_(std::move(other.buffer_)),
        closed_(other.closed_) {
    other.closed_ = true;
  }
  ExternalVector &operator=(ExternalVector &&) = delete;

  // Append a zeroed record and return a view for filling it in.
  // The view is valid until the next call to grow().
  ViewMut<T> grow() {
    if (closed_) {
      throw std::logic_error(std::format("grow() on closed external vector {}", name_));
    }
    size_t offset = buffer_.append(T::sizeInBytes);
    return ViewMut<T>(buffer_.storage(), offset);
  }

  size_t size() const { return buffer_.size() / T::sizeInBytes; }
  bool empty() const { return size() == 0; }
  bool isOpen() const { return !closed_; }
  const std::string &name() const { return name_; }

  // Flush all records to storage and return a view over the stored data.
  // The vector is unusable afterwards, whether or not the write succeeded.
  std::optional<ArrayView<T>> close(ResourceStorageError *outError = nullptr) {
    if (closed_) {
      throw std::logic_error(std::format("external vector {} is already closed", name_));
    }
    closed_ = true;

    size_t count = size();
    bool written = storage_->write(name_, schema_, buffer_.bytes(), outError);
    buffer_.release();
    if (!written) {
      return std::nullopt;
    }

    auto data = storage_->read(name_, schema_, outError);
    if (!data) {
      return std::nullopt;
    }
    logger().debug("closed external vector {} with {} elements", name_, count);
    return ArrayView<T>(*data);
  }

private:
  std::shared_ptr<ResourceStorage> storage_;
  std::string name_;
  std::string schema_;
  detail::GrowthBuffer buffer_;
  bool closed_ = false;
};

} // namespace flatdata

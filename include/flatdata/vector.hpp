#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "array_view.hpp"

namespace flatdata {

namespace detail {

// Append-only byte buffer growing by doubling, always followed by a zeroed
// padding tail so field writes near the end stay inside the allocation.
class GrowthBuffer {
public:
  static constexpr size_t initialCapacity = 64;

  // Append `count` zero bytes and return the offset where they start.
  // Invalidates pointers and spans into the buffer when it reallocates.
  size_t append(size_t count) {
    size_t required = size_ + count + PADDING_SIZE;
    if (required > data_.size()) {
      size_t capacity = data_.empty() ? initialCapacity : data_.size();
      while (capacity < required) {
        capacity *= 2;
      }
      data_.resize(capacity, 0);
    }
    size_t offset = size_;
    size_ += count;
    return offset;
  }

  // Whole allocation including padding
  std::span<uint8_t> storage() { return data_; }

  // Logically used bytes only
  std::span<const uint8_t> bytes() const { return {data_.data(), size_}; }

  size_t size() const { return size_; }
  size_t capacity() const { return data_.size(); }

  void release() {
    data_.clear();
    data_.shrink_to_fit();
    size_ = 0;
  }

private:
  std::vector<uint8_t> data_;
  size_t size_ = 0;
};

} // namespace detail

// In-memory growable sequence of records, e.g. to assemble a vector resource
// before writing it in one go
template <StructType T> class Vector {
public:
  Vector() = default;
  explicit Vector(size_t count) {
    for (size_t i = 0; i < count; ++i) {
      grow();
    }
  }

  // Append a zeroed record and return a view for filling it in.
  // The view is valid until the next call to grow().
  ViewMut<T> grow() {
    size_t offset = buffer_.append(T::sizeInBytes);
    return ViewMut<T>(buffer_.storage(), offset);
  }

  ViewMut<T> at(size_t index) {
    return ViewMut<T>(buffer_.storage(), view().at(index).offset());
  }
  View<T> at(size_t index) const { return view().at(index); }

  size_t size() const { return buffer_.size() / T::sizeInBytes; }
  bool empty() const { return size() == 0; }

  ArrayView<T> view() const { return ArrayView<T>(buffer_.bytes()); }
  std::span<const uint8_t> bytes() const { return buffer_.bytes(); }

private:
  detail::GrowthBuffer buffer_;
};

} // namespace flatdata

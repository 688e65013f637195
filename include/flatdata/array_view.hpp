#pragma once

#include <cstddef>
#include <format>
#include <iterator>
#include <span>
#include <stdexcept>

#include "struct_view.hpp"

namespace flatdata {

// Zero-copy read-only sequence of fixed-size records over borrowed bytes.
// Trailing bytes that do not form a whole record are ignored.
template <StructType T> class ArrayView {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = View<T>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = View<T>;

    Iterator() = default;
    Iterator(const ArrayView *view, size_t index) : view_(view), index_(index) {}

    View<T> operator*() const { return view_->at(index_); }
    Iterator &operator++() {
      ++index_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator copy = *this;
      ++index_;
      return copy;
    }
    bool operator==(const Iterator &other) const { return index_ == other.index_; }

  private:
    const ArrayView *view_ = nullptr;
    size_t index_ = 0;
  };

  ArrayView() = default;
  explicit ArrayView(std::span<const uint8_t> data) : data_(data) {}

  size_t size() const { return data_.size() / T::sizeInBytes; }
  bool empty() const { return size() == 0; }

  View<T> at(size_t index) const {
    if (index >= size()) {
      throw std::out_of_range(
          std::format("{} index {} out of range (size {})", T::NAME, index, size()));
    }
    return View<T>(data_, index * T::sizeInBytes);
  }

  View<T> operator[](size_t index) const { return at(index); }

  View<T> front() const { return at(0); }
  View<T> back() const { return at(size() - 1); }

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, size()); }

  // Underlying bytes, e.g. to write them into another storage
  std::span<const uint8_t> bytes() const { return data_; }

private:
  std::span<const uint8_t> data_;
};

} // namespace flatdata

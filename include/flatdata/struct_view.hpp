#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "bit_codec.hpp"
#include "types.hpp"

namespace flatdata {

// Typed field descriptor as emitted by the schema compiler.
// offset is the bit offset of the field inside its struct.
template <typename T> struct Field {
  using value_type = T;

  std::string_view name;
  uint32_t offset = 0;
  uint32_t width = 0;

  static constexpr bool isSigned = std::is_signed_v<T>;
};

// Untyped field entry of a reflection table
struct FieldInfo {
  std::string name;
  uint32_t offset = 0;
  uint32_t width = 0;
  bool isSigned = false;

  bool operator==(const FieldInfo &) const = default;
};

// Reflection table of one struct: name -> (bit offset, bit width, signedness)
class StructLayout {
public:
  StructLayout() = default;
  StructLayout(std::string name, size_t sizeInBytes, std::vector<FieldInfo> fields);

  const std::string &name() const { return name_; }
  size_t sizeInBytes() const { return sizeInBytes_; }
  const std::vector<FieldInfo> &fields() const { return fields_; }

  // Returns nullptr if there is no field with this name
  const FieldInfo *find(std::string_view fieldName) const;

  bool operator==(const StructLayout &) const = default;

private:
  std::string name_;
  size_t sizeInBytes_ = 0;
  std::vector<FieldInfo> fields_;
};

// A struct type usable with the views below: a fixed byte size and a name
template <typename S>
concept StructType = requires {
  { S::sizeInBytes } -> std::convertible_to<size_t>;
  { S::NAME } -> std::convertible_to<std::string_view>;
};

// Read-only window onto one fixed-size record inside a borrowed buffer.
// The window is bounds-checked once at construction.
class StructView {
public:
  StructView() = default;
  StructView(std::span<const uint8_t> buffer, size_t offset, size_t size)
      : buffer_(buffer), offset_(offset), size_(size) {
    if (offset > buffer.size() || size > buffer.size() - offset) {
      throw std::out_of_range("struct view exceeds its buffer");
    }
  }

  template <typename T> T get(const Field<T> &field) const {
    return readField<T>(data(), field.offset, field.width);
  }

  // Raw access through a reflection table entry; signed fields are sign-extended
  uint64_t get(const FieldInfo &field) const {
    return readBits(data(), field.offset, field.width, field.isSigned);
  }

  const uint8_t *data() const { return buffer_.data() + offset_; }
  size_t offset() const { return offset_; }
  size_t size() const { return size_; }
  std::span<const uint8_t> bytes() const { return buffer_.subspan(offset_, size_); }

  // Identity: same backing buffer, same position
  bool operator==(const StructView &other) const {
    return buffer_.data() == other.buffer_.data() && offset_ == other.offset_;
  }

private:
  std::span<const uint8_t> buffer_;
  size_t offset_ = 0;
  size_t size_ = 0;
};

// Mutable window; writes go straight into the backing buffer
class StructViewMut {
public:
  StructViewMut() = default;
  StructViewMut(std::span<uint8_t> buffer, size_t offset, size_t size)
      : buffer_(buffer), offset_(offset), size_(size) {
    if (offset > buffer.size() || size > buffer.size() - offset) {
      throw std::out_of_range("struct view exceeds its buffer");
    }
  }

  template <typename T> T get(const Field<T> &field) const {
    return readField<T>(data(), field.offset, field.width);
  }

  template <typename T, typename V> void set(const Field<T> &field, V value) {
    writeField<T>(data(), field.offset, field.width, static_cast<T>(value));
  }

  uint64_t get(const FieldInfo &field) const {
    return readBits(data(), field.offset, field.width, field.isSigned);
  }

  void set(const FieldInfo &field, uint64_t value) {
    writeBits(data(), field.offset, field.width, value);
  }

  uint8_t *data() const { return buffer_.data() + offset_; }
  size_t offset() const { return offset_; }
  size_t size() const { return size_; }
  std::span<const uint8_t> bytes() const { return {data(), size_}; }

  StructView asConst() const { return StructView(buffer_, offset_, size_); }

  bool operator==(const StructViewMut &other) const {
    return buffer_.data() == other.buffer_.data() && offset_ == other.offset_;
  }

private:
  std::span<uint8_t> buffer_;
  size_t offset_ = 0;
  size_t size_ = 0;
};

// Views tagged with their struct type
template <StructType S> class View : public StructView {
public:
  using struct_type = S;

  View() = default;
  View(std::span<const uint8_t> buffer, size_t offset)
      : StructView(buffer, offset, S::sizeInBytes) {}
};

template <StructType S> class ViewMut : public StructViewMut {
public:
  using struct_type = S;

  ViewMut() = default;
  ViewMut(std::span<uint8_t> buffer, size_t offset)
      : StructViewMut(buffer, offset, S::sizeInBytes) {}

  View<S> asConst() const {
    return View<S>(std::span<const uint8_t>(data(), S::sizeInBytes), 0);
  }
};

// Owning storage for a single struct, e.g. for struct resources of an archive
template <StructType S> class StructBuffer {
public:
  StructBuffer() { data_.fill(0); }

  ViewMut<S> mut() { return ViewMut<S>(std::span<uint8_t>(data_), 0); }
  View<S> view() const { return View<S>(std::span<const uint8_t>(data_), 0); }

  // Payload without the padding tail
  std::span<const uint8_t> bytes() const { return {data_.data(), S::sizeInBytes}; }

private:
  std::array<uint8_t, S::sizeInBytes + PADDING_SIZE> data_;
};

} // namespace flatdata

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "endian.hpp"

namespace flatdata {

// Mask with the lowest `width` bits set (width in 1..64)
inline constexpr uint64_t bitMask(unsigned width) noexcept {
  return width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
}

// Read a `width`-bit field starting `bitOffset` bits into data (LSB-first).
// Touches only the bytes covering [bitOffset, bitOffset + width), at most 9.
// When isSigned is set, the result is sign-extended from bit width - 1.
inline uint64_t readBits(const uint8_t *data, size_t bitOffset, unsigned width,
                         bool isSigned = false) noexcept {
  assert(width >= 1 && width <= 64);

  const uint8_t *bytes = data + bitOffset / 8;
  const unsigned shift = static_cast<unsigned>(bitOffset % 8);
  const size_t count = (shift + width + 7) / 8;

  uint64_t value = loadLE(bytes, std::min<size_t>(count, 8)) >> shift;
  if (count == 9) {
    // shift > 0 here, the ninth byte carries the top `shift` bits
    value |= static_cast<uint64_t>(bytes[8]) << (64 - shift);
  }
  value &= bitMask(width);

  if (isSigned && width < 64 && (value >> (width - 1)) & 1) {
    value |= ~bitMask(width);
  }
  return value;
}

// Write the low `width` bits of value at `bitOffset`, leaving all other bits intact
inline void writeBits(uint8_t *data, size_t bitOffset, unsigned width, uint64_t value) noexcept {
  assert(width >= 1 && width <= 64);

  uint8_t *bytes = data + bitOffset / 8;
  const unsigned shift = static_cast<unsigned>(bitOffset % 8);
  const size_t count = (shift + width + 7) / 8;
  const size_t lowCount = std::min<size_t>(count, 8);
  const uint64_t mask = bitMask(width);

  value &= mask;
  uint64_t word = loadLE(bytes, lowCount);
  word = (word & ~(mask << shift)) | (value << shift);
  storeLE(bytes, word, lowCount);

  if (count == 9) {
    const uint8_t highMask = static_cast<uint8_t>(mask >> (64 - shift));
    const uint8_t high = static_cast<uint8_t>(value >> (64 - shift));
    bytes[8] = static_cast<uint8_t>((bytes[8] & ~highMask) | high);
  }
}

// Typed convenience wrappers, signedness taken from T
template <typename T> inline T readField(const uint8_t *data, size_t bitOffset, unsigned width) {
  static_assert(std::is_integral_v<T>, "fields must be integral");
  if constexpr (std::is_same_v<T, bool>) {
    return readBits(data, bitOffset, width) != 0;
  } else {
    return static_cast<T>(readBits(data, bitOffset, width, std::is_signed_v<T>));
  }
}

template <typename T>
inline void writeField(uint8_t *data, size_t bitOffset, unsigned width, T value) {
  static_assert(std::is_integral_v<T>, "fields must be integral");
  writeBits(data, bitOffset, width, static_cast<uint64_t>(value));
}

} // namespace flatdata

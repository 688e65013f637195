#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace flatdata {

namespace detail {

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert little-endian to host byte order
inline constexpr uint64_t leToHost64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
inline constexpr uint64_t hostToLe64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Load `count` (<= 8) bytes as a little-endian integer
inline uint64_t loadLE(const uint8_t *data, size_t count) noexcept {
  uint64_t value = 0;
  for (size_t i = 0; i < count; ++i) {
    value |= static_cast<uint64_t>(data[i]) << (8 * i);
  }
  return value;
}

// Store the low `count` (<= 8) bytes of value in little-endian order
inline void storeLE(uint8_t *data, uint64_t value, size_t count) noexcept {
  for (size_t i = 0; i < count; ++i) {
    data[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

// Fixed 8-byte little-endian size header used by the resource framing
inline uint64_t readSizeHeader(const uint8_t *data) noexcept {
  uint64_t value;
  std::memcpy(&value, data, sizeof(value));
  return leToHost64(value);
}

inline void writeSizeHeader(uint8_t *data, uint64_t size) noexcept {
  uint64_t value = hostToLe64(size);
  std::memcpy(data, &value, sizeof(value));
}

} // namespace flatdata

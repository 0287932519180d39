#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

// Little-endian helpers for binary STL, independent of host byte order

[[nodiscard]] inline uint32_t load_u32_le(const unsigned char *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

[[nodiscard]] inline float load_f32_le(const unsigned char *p) { return std::bit_cast<float>(load_u32_le(p)); }

inline void store_u32_le(unsigned char *p, uint32_t value) {
  p[0] = static_cast<unsigned char>(value);
  p[1] = static_cast<unsigned char>(value >> 8);
  p[2] = static_cast<unsigned char>(value >> 16);
  p[3] = static_cast<unsigned char>(value >> 24);
}

inline void store_f32_le(unsigned char *p, float value) { store_u32_le(p, std::bit_cast<uint32_t>(value)); }

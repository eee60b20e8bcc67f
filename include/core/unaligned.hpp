#pragma once
// Little-endian loads/stores from unaligned byte pointers.
// Hashes read their input as LE words regardless of host byte order, and the
// register codec writes LE words, so sketches are portable between hosts.
#include <cstdint>
#include <cstddef>
#include <cstring>

static inline uint32_t GET_U32(const uint8_t* b, uint32_t i) {
  return (uint32_t)b[i] | ((uint32_t)b[i + 1] << 8) |
         ((uint32_t)b[i + 2] << 16) | ((uint32_t)b[i + 3] << 24);
}
static inline uint64_t GET_U64(const uint8_t* b, uint32_t i) {
  return (uint64_t)GET_U32(b, i) | ((uint64_t)GET_U32(b, i + 4) << 32);
}
// Reads the trailing 0..7 bytes of a buffer into the low bytes of a word.
static inline uint64_t GET_TAIL(const uint8_t* b, std::size_t n) {
  uint64_t t = 0;
  for (std::size_t k = 0; k < n; ++k) t |= (uint64_t)b[k] << (8 * k);
  return t;
}
static inline void PUT_U64(uint8_t* b, uint64_t v) {
  for (int k = 0; k < 8; ++k) b[k] = (uint8_t)(v >> (8 * k));
}

/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Byte-order and text helpers for the wire codec.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mrelay {

// ============================================================================
// Little-endian integer helpers
// ============================================================================

inline uint16_t load_le16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

inline uint32_t load_le32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline void append_le16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline void append_le32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// ============================================================================
// Text helpers
// ============================================================================

inline std::string to_hex(const uint8_t* data, size_t size) {
  std::string result;
  result.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    result += "0123456789abcdef"[data[i] >> 4];
    result += "0123456789abcdef"[data[i] & 0x0f];
  }
  return result;
}

inline bool is_ascii(std::string_view text) {
  for (char c : text) {
    if (static_cast<uint8_t>(c) > 0x7F) return false;
  }
  return true;
}

// Strip the null padding of a fixed-width wire field
inline std::string_view trim_trailing_nulls(std::string_view field) {
  while (!field.empty() && field.back() == '\0') {
    field.remove_suffix(1);
  }
  return field;
}

}  // namespace mrelay

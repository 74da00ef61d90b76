/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "Debug.h"

/*
 * Big-endian readers and writers for the class file format. Readers advance
 * `buffer` and never walk past `buffer_end`.
 */
namespace byte_io {

inline uint8_t read8(const uint8_t*& buffer, const uint8_t* buffer_end) {
  always_assert_type_log(buffer < buffer_end,
                         AgentGuardError::BUFFER_END_EXCEEDED,
                         "Buffer overflow");
  return *buffer++;
}

inline uint16_t read16(const uint8_t*& buffer, const uint8_t* buffer_end) {
  always_assert_type_log(buffer + sizeof(uint16_t) <= buffer_end,
                         AgentGuardError::BUFFER_END_EXCEEDED,
                         "Buffer overflow");
  uint16_t rv = (uint16_t)((buffer[0] << 8) | buffer[1]);
  buffer += sizeof(uint16_t);
  return rv;
}

inline uint32_t read32(const uint8_t*& buffer, const uint8_t* buffer_end) {
  always_assert_type_log(buffer + sizeof(uint32_t) <= buffer_end,
                         AgentGuardError::BUFFER_END_EXCEEDED,
                         "Buffer overflow");
  uint32_t rv = ((uint32_t)buffer[0] << 24) | ((uint32_t)buffer[1] << 16) |
                ((uint32_t)buffer[2] << 8) | (uint32_t)buffer[3];
  buffer += sizeof(uint32_t);
  return rv;
}

inline void skip(const uint8_t*& buffer,
                 const uint8_t* buffer_end,
                 size_t count) {
  always_assert_type_log(count <= (size_t)(buffer_end - buffer),
                         AgentGuardError::BUFFER_END_EXCEEDED,
                         "Buffer overflow");
  buffer += count;
}

inline void write8(std::vector<uint8_t>& out, uint8_t v) { out.push_back(v); }

inline void write16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)v);
}

inline void write32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back((uint8_t)(v >> 24));
  out.push_back((uint8_t)(v >> 16));
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)v);
}

inline void write_bytes(std::vector<uint8_t>& out,
                        const uint8_t* data,
                        size_t size) {
  out.insert(out.end(), data, data + size);
}

// Overwrites a previously reserved big-endian u4 at `pos`.
inline void patch32(std::vector<uint8_t>& out, size_t pos, uint32_t v) {
  always_assert(pos + 4 <= out.size());
  out[pos] = (uint8_t)(v >> 24);
  out[pos + 1] = (uint8_t)(v >> 16);
  out[pos + 2] = (uint8_t)(v >> 8);
  out[pos + 3] = (uint8_t)v;
}

} // namespace byte_io

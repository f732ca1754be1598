/**
 * @file byte_order.h
 * @brief Big-endian and variable-length quantity helpers for SMF data.
 */

#ifndef MIDIDIFF_MIDI_BYTE_ORDER_H
#define MIDIDIFF_MIDI_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace mididiff {

/**
 * @brief Read a big-endian uint16 from a byte buffer.
 * @param data Pointer to at least 2 bytes of data
 * @return Decoded 16-bit value
 */
inline uint16_t readUint16BE(const uint8_t* data) {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

/**
 * @brief Read a big-endian uint32 from a byte buffer.
 * @param data Pointer to at least 4 bytes of data
 * @return Decoded 32-bit value
 */
inline uint32_t readUint32BE(const uint8_t* data) {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | data[3];
}

inline void writeUint16BE(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back((value >> 8) & 0xFF);
  buf.push_back(value & 0xFF);
}

inline void writeUint32BE(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back((value >> 24) & 0xFF);
  buf.push_back((value >> 16) & 0xFF);
  buf.push_back((value >> 8) & 0xFF);
  buf.push_back(value & 0xFF);
}

/**
 * @brief Read a MIDI variable-length quantity (VLQ).
 *
 * 7 data bits per byte, high bit set on every byte except the last.
 * At most 4 bytes (28 bits of data).
 *
 * @param data Byte buffer to read from
 * @param offset Current read position (updated on return)
 * @param max_size Buffer size
 * @param value Output: decoded value
 * @return false if the data is truncated or longer than 4 bytes
 */
inline bool readVariableLength(const uint8_t* data, size_t& offset, size_t max_size,
                               uint32_t& value) {
  value = 0;
  for (int count = 0; count < 4; ++count) {  // NOLINT: 4 is max VLQ byte count
    if (offset >= max_size) return false;
    uint8_t byte = data[offset++];
    value = (value << 7) | (byte & 0x7F);  // NOLINT: bit operations for VLQ decoding
    if (!(byte & 0x80)) return true;        // NOLINT: bit check for continuation
  }
  return false;
}

/**
 * @brief Append a MIDI variable-length quantity to a buffer.
 * @param buf Output buffer to append to
 * @param value Value to encode (at most kMaxVariableLength)
 * @return false if the value does not fit in 4 VLQ bytes (buffer untouched)
 */
inline bool writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) return false;

  uint8_t temp[4];
  size_t count = 0;
  do {
    temp[count++] = value & 0x7F;
    value >>= 7;
  } while (value > 0);

  for (size_t i = count; i > 0; --i) {
    uint8_t b = temp[i - 1];
    if (i > 1) b |= 0x80;
    buf.push_back(b);
  }
  return true;
}

}  // namespace mididiff

#endif  // MIDIDIFF_MIDI_BYTE_ORDER_H

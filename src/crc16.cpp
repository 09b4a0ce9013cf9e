/**
 * @file crc16.cpp
 * @brief CRC-16 checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "crc16.hpp"

namespace file2afsk
{
namespace internal
{

uint16_t calc_crc16(const uint8_t* data, size_t len)
{
  uint16_t crc = 0xFFFF;

  for (size_t i = 0; i < len; ++i)
  {
    crc ^= static_cast<uint16_t>(data[i]) << 8;

    for (int bit = 0; bit < 8; ++bit)
    {
      if (crc & 0x8000)
      {
        crc = static_cast<uint16_t>((crc << 1) ^ CRC16_POLY);
      }
      else
      {
        crc <<= 1;
      }
    }
  }

  return crc;
}

}  // namespace internal
}  // namespace file2afsk

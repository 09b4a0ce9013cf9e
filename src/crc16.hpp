/**
 * @file crc16.hpp
 * @brief CRC-16 checksum calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace file2afsk
{
namespace internal
{

/**
 * @brief CRC-16/CCITT polynomial (x^16 + x^12 + x^5 + 1)
 */
constexpr uint16_t CRC16_POLY = 0x1021;

/**
 * @brief Calculate CRC-16/CCITT-FALSE checksum
 *
 * Polynomial 0x1021, initial value 0xFFFF, no reflection, no final XOR.
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return CRC-16 checksum value
 */
uint16_t calc_crc16(const uint8_t* data, size_t len);

}  // namespace internal
}  // namespace file2afsk

/**
 * @file ax25.hpp
 * @brief AX.25 address field helpers (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "file2afsk/protocol.hpp"

namespace file2afsk
{
namespace internal
{

/**
 * @brief Callsign split into its base call and SSID
 */
struct Callsign
{
  std::string call;  ///< Upper-case, at most CALLSIGN_LEN characters
  uint8_t ssid;      ///< 0-15
};

/**
 * @brief Parse "CALL" or "CALL-SSID"
 *
 * The base call is upper-cased and truncated to CALLSIGN_LEN characters.
 *
 * @param text Callsign text
 * @param out  Parsed callsign
 * @return ErrorCode::OK, or ErrorCode::INVALID_CALLSIGN when the call is
 *         empty, contains characters other than A-Z / 0-9, or the SSID is
 *         not a number in 0-15
 */
ErrorCode parse_callsign(const std::string& text, Callsign& out);

/**
 * @brief Format a callsign, omitting a zero SSID
 */
std::string format_callsign(const Callsign& callsign);

/**
 * @brief Append a 7-byte AX.25 address field
 *
 * @param callsign Parsed callsign
 * @param last     Set the address extension bit (last address in the header)
 * @param out      Buffer the address is appended to
 */
void encode_address(const Callsign& callsign, bool last, std::vector<uint8_t>& out);

/**
 * @brief Decode a 7-byte AX.25 address field
 *
 * @param field Pointer to ADDRESS_LEN bytes
 * @param out   Decoded callsign (trailing spaces removed)
 * @param last  Receives the address extension bit
 * @return true if every callsign byte is a shifted A-Z, 0-9 or trailing space
 */
bool decode_address(const uint8_t* field, Callsign& out, bool& last);

}  // namespace internal
}  // namespace file2afsk

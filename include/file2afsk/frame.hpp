/**
 * @file frame.hpp
 * @brief Chunk frame encoding/decoding
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

/**
 * @brief One file chunk addressed as an AX.25 UI frame
 */
struct Frame
{
  std::string destination;       ///< File identifier ("CALL" or "CALL-SSID")
  std::string source;            ///< Sender callsign ("CALL" or "CALL-SSID")
  uint16_t seq = 0;              ///< Chunk index, 0-based
  bool is_last = false;          ///< Terminal marker
  std::vector<uint8_t> payload;  ///< Chunk bytes
};

/**
 * @brief Encode a chunk frame
 *
 * Generates: [DEST][SRC][CTRL][PID][SEQ_H][SEQ_L][FLAGS][DATA...]
 *
 * Callsigns are upper-cased and padded or truncated to the AX.25 field
 * width. Encoding is deterministic.
 *
 * @param frame Frame fields
 * @param out   Output buffer for the encoded frame (cleared first)
 * @return ErrorCode::OK on success,
 *         ErrorCode::INVALID_CALLSIGN if either callsign cannot be encoded,
 *         ErrorCode::PAYLOAD_TOO_LARGE if the payload exceeds MAX_CHUNK_SIZE
 */
ErrorCode encode_frame(const Frame& frame, std::vector<uint8_t>& out);

/**
 * @brief Decode a chunk frame
 *
 * Digipeater addresses between the source and the control field are
 * validated and skipped.
 *
 * @param data Raw AX.25 frame (no flags, no FCS)
 * @param len  Frame length in bytes
 * @param out  Decoded fields (untouched on failure)
 * @return ErrorCode::OK on success, ErrorCode::MALFORMED_FRAME otherwise
 */
ErrorCode decode_frame(const uint8_t* data, size_t len, Frame& out);

}  // namespace file2afsk

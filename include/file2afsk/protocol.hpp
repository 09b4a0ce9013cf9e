/**
 * @file protocol.hpp
 * @brief file2afsk protocol definitions
 *
 * KISS framing constants and the AX.25 UI frame layout used to carry
 * file chunks through an external TNC.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace file2afsk
{

/* ========================================================================= */
/* KISS constants                                                            */
/* ========================================================================= */

constexpr uint8_t FEND = 0xC0;   ///< Frame delimiter
constexpr uint8_t FESC = 0xDB;   ///< Escape sentinel
constexpr uint8_t TFEND = 0xDC;  ///< Escaped FEND
constexpr uint8_t TFESC = 0xDD;  ///< Escaped FESC

/**
 * @brief KISS command nibble for a data frame
 *
 * The full command byte is (port << 4) | KISS_CMD_DATA.
 */
constexpr uint8_t KISS_CMD_DATA = 0x00;

/**
 * @brief Largest de-escaped KISS frame accepted by the decoder
 *
 * Anything longer is treated as an unterminated frame and dropped.
 */
constexpr size_t KISS_MAX_FRAME_SIZE = 2048;

/* ========================================================================= */
/* AX.25 constants                                                           */
/* ========================================================================= */

constexpr size_t CALLSIGN_LEN = 6;      ///< Callsign characters per address
constexpr size_t ADDRESS_LEN = 7;       ///< Callsign + SSID byte
constexpr size_t MAX_DIGIPEATERS = 8;   ///< Repeater addresses allowed after source
constexpr uint8_t SSID_MAX = 15;

constexpr uint8_t AX25_CONTROL_UI = 0x03;  ///< Unnumbered information
constexpr uint8_t AX25_PF_BIT = 0x10;      ///< Poll/final bit of the control field
constexpr uint8_t AX25_PID_NONE = 0xF0;    ///< No layer 3 protocol

/**
 * @brief AX.25 information field limit (N1 default)
 */
constexpr size_t AX25_MAX_INFO = 256;

/* ========================================================================= */
/* Chunk frame structure                                                     */
/* ========================================================================= */

/**
 * Frame format (as handed to the TNC, which adds flags and FCS):
 *
 * [DEST(7)][SRC(7)][CTRL][PID][SEQ_H][SEQ_L][FLAGS][DATA...]
 *
 * - DEST:  7 bytes (file identifier as an AX.25 address)
 * - SRC:   7 bytes (sender callsign, extension bit set)
 * - CTRL:  1 byte  (0x03, UI frame)
 * - PID:   1 byte  (0xF0, no layer 3)
 * - SEQ:   2 bytes (chunk index, big-endian)
 * - FLAGS: 1 byte  (bit 0 = last chunk, other bits reserved)
 * - DATA:  N bytes (0 <= N <= MAX_CHUNK_SIZE)
 *
 * Minimum frame size: 19 bytes
 */

constexpr size_t ADDRESS_HEADER_SIZE = 2 * ADDRESS_LEN + 2;  ///< DEST + SRC + CTRL + PID
constexpr size_t CHUNK_HEADER_SIZE = 3;                      ///< SEQ + FLAGS
constexpr size_t MIN_FRAME_SIZE = ADDRESS_HEADER_SIZE + CHUNK_HEADER_SIZE;

constexpr uint8_t FLAG_LAST = 0x01;

/**
 * @brief Chunk size bounds
 *
 * The upper bound keeps CHUNK_HEADER + DATA inside the AX.25 information
 * field limit.
 */
constexpr size_t MIN_CHUNK_SIZE = 16;
constexpr size_t MAX_CHUNK_SIZE = AX25_MAX_INFO - CHUNK_HEADER_SIZE;
constexpr size_t DEFAULT_CHUNK_SIZE = 100;

/**
 * @brief Highest number of chunks a single transfer can carry
 */
constexpr size_t MAX_CHUNKS = 65536;

/* ========================================================================= */
/* Transport defaults                                                        */
/* ========================================================================= */

constexpr const char* DEFAULT_KISS_HOST = "localhost";
constexpr uint16_t DEFAULT_KISS_PORT = 8001;
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 10000;
constexpr int DEFAULT_POLL_TIMEOUT_MS = 200;

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Result codes returned by every file2afsk operation
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "file2afsk/errors.def"
#undef ERR
};

/**
 * @brief Get a human readable message for an error code
 *
 * @param code Error code
 * @return Static message string
 */
const char* error_message(ErrorCode code);

}  // namespace file2afsk

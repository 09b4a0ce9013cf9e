/**
 * @file kiss.hpp
 * @brief KISS framing: escaping, encapsulation and a byte-fed decoder
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "file2afsk/protocol.hpp"

namespace file2afsk
{

/**
 * @brief Append KISS-escaped bytes to a buffer
 *
 * FEND becomes FESC TFEND, FESC becomes FESC TFESC.
 *
 * @param data Bytes to escape
 * @param len  Number of bytes
 * @param out  Buffer the escaped bytes are appended to
 */
void kiss_escape(const uint8_t* data, size_t len, std::vector<uint8_t>& out);

/**
 * @brief Reverse kiss_escape()
 *
 * @param data Escaped bytes (no delimiters)
 * @param len  Number of bytes
 * @param out  Output buffer (cleared first)
 * @return false on a dangling FESC or an unknown escape sequence
 */
bool kiss_unescape(const uint8_t* data, size_t len, std::vector<uint8_t>& out);

/**
 * @brief Wrap a frame as a KISS data frame
 *
 * Generates: [FEND][PORT<<4 | 0x00][escaped frame...][FEND]
 *
 * @param data Raw AX.25 frame
 * @param len  Frame length in bytes
 * @param port TNC port (0-15)
 * @param out  Output buffer (cleared first)
 */
void kiss_encode(const uint8_t* data, size_t len, uint8_t port, std::vector<uint8_t>& out);

/**
 * @brief Incremental KISS decoder
 *
 * Feed bytes as they arrive from the TNC in any fragmentation; the frame
 * callback fires once per complete data frame with the de-escaped payload.
 * Broken frames (invalid escape, oversize, non-data command) are dropped
 * and decoding resumes at the next FEND.
 *
 * Example usage:
 * @code
 * KissDecoder decoder([](uint8_t port, const uint8_t* data, size_t len)
 *                     { handle_ax25(data, len); });
 *
 * while (read(fd, buf, sizeof(buf)) > 0) {
 *   decoder.feed(buf, n);
 * }
 * @endcode
 */
class KissDecoder
{
 public:
  /**
   * @brief Frame callback function type
   *
   * @param port TNC port taken from the command byte
   * @param data De-escaped frame payload (valid only during the call)
   * @param len  Payload length in bytes
   */
  using FrameFn = std::function<void(uint8_t port, const uint8_t* data, size_t len)>;

  /**
   * @brief Construct decoder
   *
   * @param on_frame       Callback for every decoded data frame
   * @param max_frame_size Frames longer than this are dropped
   */
  explicit KissDecoder(FrameFn on_frame, size_t max_frame_size = KISS_MAX_FRAME_SIZE);

  /**
   * @brief Process one received byte
   *
   * @param byte Received byte
   */
  void feed_byte(uint8_t byte);

  /**
   * @brief Process a block of received bytes
   */
  void feed(const uint8_t* data, size_t len);

  /**
   * @brief Discard any partial frame and wait for the next FEND
   */
  void reset();

  /**
   * @brief Number of frames dropped since construction
   */
  size_t dropped_frames() const
  {
    return dropped_;
  }

 private:
  /**
   * @brief Frame reception state machine
   */
  enum class State
  {
    WAIT_FEND,     // Hunting for a frame delimiter
    WAIT_CMD,      // Delimiter seen, waiting for command byte
    WAIT_DATA,     // Receiving frame bytes
    WAIT_ESCAPED,  // FESC seen, waiting for TFEND/TFESC
  };

  void handle_frame();
  void drop_frame(State next);

  FrameFn on_frame_;             ///< Frame callback
  std::vector<uint8_t> buffer_;  ///< De-escaped frame bytes
  size_t max_frame_size_;        ///< Oversize limit
  State state_;                  ///< State machine state
  uint8_t cmd_;                  ///< Current command byte
  size_t dropped_;               ///< Dropped frame counter
};

}  // namespace file2afsk

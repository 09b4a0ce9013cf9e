/**
 * @file kiss_transport.hpp
 * @brief KISS framing bound to a byte-stream transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "file2afsk/kiss.hpp"
#include "file2afsk/protocol.hpp"
#include "file2afsk/transport.hpp"

namespace file2afsk
{

/**
 * @brief Sends and receives raw AX.25 frames through a KISS TNC
 *
 * Example usage:
 * @code
 * std::unique_ptr<Transport> tcp;
 * open_tcp("localhost", 8001, 10000, tcp);
 * KissTransport kiss(*tcp);
 *
 * std::vector<uint8_t> frame;
 * while (kiss.next_frame(frame, 200) != ErrorCode::TRANSPORT_CLOSED) {
 *   ...
 * }
 * @endcode
 */
class KissTransport
{
 public:
  /**
   * @param transport Underlying channel, must outlive this object
   * @param port      TNC port for outgoing frames and the incoming filter
   */
  explicit KissTransport(Transport& transport, uint8_t port = 0);

  KissTransport(const KissTransport&) = delete;
  KissTransport& operator=(const KissTransport&) = delete;

  /**
   * @brief Send one AX.25 frame as a KISS data frame
   *
   * @return ErrorCode::OK or ErrorCode::TRANSPORT_UNAVAILABLE
   */
  ErrorCode send(const std::vector<uint8_t>& frame);

  /**
   * @brief Wait for the next AX.25 frame from the TNC
   *
   * @param out        Receives the de-escaped frame
   * @param timeout_ms Wait limit per underlying read
   * @return ErrorCode::OK with a frame in out,
   *         ErrorCode::TIMEOUT if no complete frame arrived yet,
   *         ErrorCode::TRANSPORT_CLOSED or ErrorCode::TRANSPORT_UNAVAILABLE
   *         when the stream has ended
   */
  ErrorCode next_frame(std::vector<uint8_t>& out, int timeout_ms = DEFAULT_POLL_TIMEOUT_MS);

  /**
   * @brief Drop buffered partial input, e.g. after reconnecting
   */
  void reset();

  /**
   * @brief Release the underlying transport
   */
  void close();

  /**
   * @brief KISS frames dropped as corrupt, oversized or not for this port
   */
  size_t dropped_frames() const
  {
    return decoder_.dropped_frames() + foreign_port_;
  }

 private:
  Transport& transport_;
  uint8_t port_;
  KissDecoder decoder_;
  std::deque<std::vector<uint8_t>> pending_;  ///< Decoded, not yet returned
  std::vector<uint8_t> tx_buffer_;
  size_t foreign_port_;
};

}  // namespace file2afsk

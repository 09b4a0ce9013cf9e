/**
 * @file transport.hpp
 * @brief Byte-stream channels to the TNC
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "file2afsk/protocol.hpp"

namespace file2afsk
{

/**
 * @brief Duplex byte channel
 *
 * Implementations own their underlying handle and release it in close()
 * and on destruction.
 */
class Transport
{
 public:
  virtual ~Transport() = default;

  /**
   * @brief Write the whole buffer
   *
   * @return ErrorCode::OK, or ErrorCode::TRANSPORT_UNAVAILABLE on failure
   */
  virtual ErrorCode write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Read whatever is available, waiting at most timeout_ms
   *
   * @param buf        Destination buffer
   * @param cap        Buffer capacity
   * @param received   Number of bytes stored in buf
   * @param timeout_ms Wait limit, negative waits forever
   * @return ErrorCode::OK when bytes were read,
   *         ErrorCode::TIMEOUT when nothing arrived (or the wait was
   *         interrupted by a signal),
   *         ErrorCode::TRANSPORT_CLOSED when the peer closed the channel,
   *         ErrorCode::TRANSPORT_UNAVAILABLE on a read error
   */
  virtual ErrorCode read(uint8_t* buf, size_t cap, size_t& received, int timeout_ms) = 0;

  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

/**
 * @brief Transport over a POSIX file descriptor (socket or tty)
 */
class FdTransport : public Transport
{
 public:
  /**
   * @param fd     Open descriptor, ownership is taken
   * @param socket Use send(MSG_NOSIGNAL) instead of write()
   */
  FdTransport(int fd, bool socket);
  ~FdTransport() override;

  FdTransport(const FdTransport&) = delete;
  FdTransport& operator=(const FdTransport&) = delete;

  ErrorCode write(const uint8_t* data, size_t len) override;
  ErrorCode read(uint8_t* buf, size_t cap, size_t& received, int timeout_ms) override;
  void close() override;

  bool is_open() const override
  {
    return fd_ >= 0;
  }

 private:
  int fd_;
  bool socket_;
};

/**
 * @brief Connect to a TNC KISS TCP server
 *
 * @param host       Host name or address
 * @param port       TCP port
 * @param timeout_ms Connect timeout
 * @param out        Connected transport
 * @return ErrorCode::OK or ErrorCode::TRANSPORT_UNAVAILABLE
 */
ErrorCode open_tcp(const std::string& host, uint16_t port, int timeout_ms,
                   std::unique_ptr<Transport>& out);

/**
 * @brief Open a serial KISS TNC (raw 8N1)
 *
 * @param device Device path (e.g. /dev/ttyUSB0 or a pty from the TNC)
 * @param baud   Baud rate
 * @param out    Opened transport
 * @return ErrorCode::OK, ErrorCode::INVALID_ARGUMENT for an unsupported
 *         baud rate, or ErrorCode::TRANSPORT_UNAVAILABLE
 */
ErrorCode open_serial(const std::string& device, uint32_t baud, std::unique_ptr<Transport>& out);

/**
 * @brief In-memory byte pipe
 *
 * write() appends to the pipe and read() consumes from it, so a sender and
 * a receiver can share one instance in place of a TNC. Reads return at most
 * max_read bytes to exercise reassembly of fragmented input.
 */
class LoopbackTransport : public Transport
{
 public:
  explicit LoopbackTransport(size_t max_read = 4096);

  ErrorCode write(const uint8_t* data, size_t len) override;
  ErrorCode read(uint8_t* buf, size_t cap, size_t& received, int timeout_ms) override;
  void close() override;

  bool is_open() const override
  {
    return open_;
  }

  /**
   * @brief Queue bytes for reading without going through write()
   */
  void inject(const std::vector<uint8_t>& bytes);

  /**
   * @brief Report TRANSPORT_CLOSED instead of TIMEOUT once the pipe is empty
   */
  void close_when_drained()
  {
    eof_ = true;
  }

  /**
   * @brief Make write() fail while set
   */
  void fail_writes(bool fail)
  {
    fail_writes_ = fail;
  }

  /**
   * @brief Bytes written or injected but not yet read
   */
  std::vector<uint8_t> pending() const;

 private:
  std::deque<uint8_t> pipe_;
  size_t max_read_;
  bool open_;
  bool eof_;
  bool fail_writes_;
};

}  // namespace file2afsk

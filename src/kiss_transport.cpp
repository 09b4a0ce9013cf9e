/**
 * @file kiss_transport.cpp
 * @brief KISS transport implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/kiss_transport.hpp"

#include <utility>

namespace file2afsk
{

KissTransport::KissTransport(Transport& transport, uint8_t port)
    : transport_(transport),
      port_(port & 0x0F),
      decoder_(
          [this](uint8_t frame_port, const uint8_t* data, size_t len)
          {
            if (frame_port != port_)
            {
              ++foreign_port_;
              return;
            }
            pending_.emplace_back(data, data + len);
          }),
      pending_(),
      tx_buffer_(),
      foreign_port_(0)
{
}

ErrorCode KissTransport::send(const std::vector<uint8_t>& frame)
{
  kiss_encode(frame.data(), frame.size(), port_, tx_buffer_);
  return transport_.write(tx_buffer_.data(), tx_buffer_.size());
}

ErrorCode KissTransport::next_frame(std::vector<uint8_t>& out, int timeout_ms)
{
  uint8_t buf[512];

  while (pending_.empty())
  {
    size_t received = 0;
    const ErrorCode rc = transport_.read(buf, sizeof(buf), received, timeout_ms);
    if (rc != ErrorCode::OK)
    {
      return rc;
    }
    decoder_.feed(buf, received);
  }

  out = std::move(pending_.front());
  pending_.pop_front();
  return ErrorCode::OK;
}

void KissTransport::reset()
{
  decoder_.reset();
  pending_.clear();
}

void KissTransport::close()
{
  transport_.close();
}

}  // namespace file2afsk

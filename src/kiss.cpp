/**
 * @file kiss.cpp
 * @brief KISS framing implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/kiss.hpp"

#include <utility>

namespace file2afsk
{

void kiss_escape(const uint8_t* data, size_t len, std::vector<uint8_t>& out)
{
  for (size_t i = 0; i < len; ++i)
  {
    switch (data[i])
    {
      case FEND:
        out.push_back(FESC);
        out.push_back(TFEND);
        break;

      case FESC:
        out.push_back(FESC);
        out.push_back(TFESC);
        break;

      default:
        out.push_back(data[i]);
        break;
    }
  }
}

bool kiss_unescape(const uint8_t* data, size_t len, std::vector<uint8_t>& out)
{
  out.clear();
  out.reserve(len);

  for (size_t i = 0; i < len; ++i)
  {
    if (data[i] != FESC)
    {
      out.push_back(data[i]);
      continue;
    }

    if (++i >= len)
    {
      return false;
    }

    if (data[i] == TFEND)
    {
      out.push_back(FEND);
    }
    else if (data[i] == TFESC)
    {
      out.push_back(FESC);
    }
    else
    {
      return false;
    }
  }

  return true;
}

void kiss_encode(const uint8_t* data, size_t len, uint8_t port, std::vector<uint8_t>& out)
{
  out.clear();
  out.reserve(len + 3);

  out.push_back(FEND);
  out.push_back(static_cast<uint8_t>(((port & 0x0F) << 4) | KISS_CMD_DATA));
  kiss_escape(data, len, out);
  out.push_back(FEND);
}

KissDecoder::KissDecoder(FrameFn on_frame, size_t max_frame_size)
    : on_frame_(std::move(on_frame)),
      buffer_(),
      max_frame_size_(max_frame_size),
      state_(State::WAIT_FEND),
      cmd_(0),
      dropped_(0)
{
  buffer_.reserve(max_frame_size);
}

void KissDecoder::feed_byte(uint8_t byte)
{
  switch (state_)
  {
    case State::WAIT_FEND:
      if (byte == FEND)
      {
        buffer_.clear();
        state_ = State::WAIT_CMD;
      }
      break;

    case State::WAIT_CMD:
      // Back-to-back FENDs are idle fill
      if (byte != FEND)
      {
        cmd_ = byte;
        buffer_.clear();
        state_ = State::WAIT_DATA;
      }
      break;

    case State::WAIT_DATA:
      if (byte == FEND)
      {
        // The closing delimiter also opens the next frame
        handle_frame();
        state_ = State::WAIT_CMD;
      }
      else if (byte == FESC)
      {
        state_ = State::WAIT_ESCAPED;
      }
      else if (buffer_.size() >= max_frame_size_)
      {
        drop_frame(State::WAIT_FEND);
      }
      else
      {
        buffer_.push_back(byte);
      }
      break;

    case State::WAIT_ESCAPED:
      if (byte == TFEND || byte == TFESC)
      {
        if (buffer_.size() >= max_frame_size_)
        {
          drop_frame(State::WAIT_FEND);
          break;
        }
        buffer_.push_back(byte == TFEND ? FEND : FESC);
        state_ = State::WAIT_DATA;
      }
      else if (byte == FEND)
      {
        drop_frame(State::WAIT_CMD);
      }
      else
      {
        drop_frame(State::WAIT_FEND);
      }
      break;
  }
}

void KissDecoder::feed(const uint8_t* data, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    feed_byte(data[i]);
  }
}

void KissDecoder::reset()
{
  buffer_.clear();
  state_ = State::WAIT_FEND;
}

void KissDecoder::handle_frame()
{
  // Only data frames carry AX.25; TNC parameter commands are ignored
  if ((cmd_ & 0x0F) != KISS_CMD_DATA || buffer_.empty())
  {
    ++dropped_;
    return;
  }

  if (on_frame_)
  {
    on_frame_(static_cast<uint8_t>(cmd_ >> 4), buffer_.data(), buffer_.size());
  }
}

void KissDecoder::drop_frame(State next)
{
  buffer_.clear();
  ++dropped_;
  state_ = next;
}

}  // namespace file2afsk

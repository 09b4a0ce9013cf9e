/**
 * @file frame.cpp
 * @brief Chunk frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/frame.hpp"

#include "ax25.hpp"

namespace file2afsk
{

ErrorCode encode_frame(const Frame& frame, std::vector<uint8_t>& out)
{
  if (frame.payload.size() > MAX_CHUNK_SIZE)
  {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  internal::Callsign dest;
  internal::Callsign src;
  if (internal::parse_callsign(frame.destination, dest) != ErrorCode::OK ||
      internal::parse_callsign(frame.source, src) != ErrorCode::OK)
  {
    return ErrorCode::INVALID_CALLSIGN;
  }

  out.clear();
  out.reserve(MIN_FRAME_SIZE + frame.payload.size());

  // Address header: destination first, source carries the extension bit
  internal::encode_address(dest, false, out);
  internal::encode_address(src, true, out);
  out.push_back(AX25_CONTROL_UI);
  out.push_back(AX25_PID_NONE);

  // Chunk header
  out.push_back(static_cast<uint8_t>((frame.seq >> 8) & 0xFF));  // SEQ_H
  out.push_back(static_cast<uint8_t>(frame.seq & 0xFF));         // SEQ_L
  out.push_back(frame.is_last ? FLAG_LAST : 0x00);

  out.insert(out.end(), frame.payload.begin(), frame.payload.end());

  return ErrorCode::OK;
}

ErrorCode decode_frame(const uint8_t* data, size_t len, Frame& out)
{
  if (data == nullptr || len < MIN_FRAME_SIZE)
  {
    return ErrorCode::MALFORMED_FRAME;
  }

  internal::Callsign dest;
  internal::Callsign src;
  bool last = false;

  if (!internal::decode_address(data, dest, last) || last)
  {
    return ErrorCode::MALFORMED_FRAME;
  }

  if (!internal::decode_address(data + ADDRESS_LEN, src, last))
  {
    return ErrorCode::MALFORMED_FRAME;
  }

  // Skip the digipeater path, if any
  size_t pos = 2 * ADDRESS_LEN;
  size_t digipeaters = 0;
  while (!last)
  {
    if (++digipeaters > MAX_DIGIPEATERS || pos + ADDRESS_LEN > len)
    {
      return ErrorCode::MALFORMED_FRAME;
    }

    internal::Callsign repeater;
    if (!internal::decode_address(data + pos, repeater, last))
    {
      return ErrorCode::MALFORMED_FRAME;
    }
    pos += ADDRESS_LEN;
  }

  if (pos + 2 + CHUNK_HEADER_SIZE > len)
  {
    return ErrorCode::MALFORMED_FRAME;
  }

  const uint8_t control = data[pos];
  const uint8_t pid = data[pos + 1];
  if ((control & ~AX25_PF_BIT) != AX25_CONTROL_UI || pid != AX25_PID_NONE)
  {
    return ErrorCode::MALFORMED_FRAME;
  }
  pos += 2;

  const uint16_t seq = static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
  const uint8_t flags = data[pos + 2];
  if (flags & ~FLAG_LAST)
  {
    return ErrorCode::MALFORMED_FRAME;
  }
  pos += CHUNK_HEADER_SIZE;

  out.destination = internal::format_callsign(dest);
  out.source = internal::format_callsign(src);
  out.seq = seq;
  out.is_last = (flags & FLAG_LAST) != 0;
  out.payload.assign(data + pos, data + len);

  return ErrorCode::OK;
}

}  // namespace file2afsk

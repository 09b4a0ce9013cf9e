/**
 * @file ax25.cpp
 * @brief AX.25 address field implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "ax25.hpp"

namespace file2afsk
{
namespace internal
{

namespace
{

bool is_call_char(char c)
{
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

char to_upper(char c)
{
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

}  // namespace

ErrorCode parse_callsign(const std::string& text, Callsign& out)
{
  const size_t dash = text.find('-');
  const std::string base = text.substr(0, dash);

  if (base.empty())
  {
    return ErrorCode::INVALID_CALLSIGN;
  }

  std::string call;
  call.reserve(base.size());
  for (const char c : base)
  {
    const char upper = to_upper(c);
    if (!is_call_char(upper))
    {
      return ErrorCode::INVALID_CALLSIGN;
    }
    call.push_back(upper);
  }

  unsigned ssid = 0;
  if (dash != std::string::npos)
  {
    const std::string digits = text.substr(dash + 1);
    if (digits.empty() || digits.size() > 2)
    {
      return ErrorCode::INVALID_CALLSIGN;
    }
    for (const char c : digits)
    {
      if (c < '0' || c > '9')
      {
        return ErrorCode::INVALID_CALLSIGN;
      }
      ssid = ssid * 10 + static_cast<unsigned>(c - '0');
    }
    if (ssid > SSID_MAX)
    {
      return ErrorCode::INVALID_CALLSIGN;
    }
  }

  if (call.size() > CALLSIGN_LEN)
  {
    call.resize(CALLSIGN_LEN);
  }

  out.call = call;
  out.ssid = static_cast<uint8_t>(ssid);
  return ErrorCode::OK;
}

std::string format_callsign(const Callsign& callsign)
{
  if (callsign.ssid == 0)
  {
    return callsign.call;
  }
  return callsign.call + "-" + std::to_string(callsign.ssid);
}

void encode_address(const Callsign& callsign, bool last, std::vector<uint8_t>& out)
{
  for (size_t i = 0; i < CALLSIGN_LEN; ++i)
  {
    const char c = i < callsign.call.size() ? callsign.call[i] : ' ';
    out.push_back(static_cast<uint8_t>(c << 1));
  }

  // SSID byte: reserved bits 0x60 set, SSID in bits 1-4, extension bit 0
  uint8_t ssid_byte = static_cast<uint8_t>(0x60 | ((callsign.ssid & 0x0F) << 1));
  if (last)
  {
    ssid_byte |= 0x01;
  }
  out.push_back(ssid_byte);
}

bool decode_address(const uint8_t* field, Callsign& out, bool& last)
{
  std::string call;
  bool padding = false;

  for (size_t i = 0; i < CALLSIGN_LEN; ++i)
  {
    // Extension bit is only valid on the SSID byte
    if (field[i] & 0x01)
    {
      return false;
    }

    const char c = static_cast<char>(field[i] >> 1);
    if (c == ' ')
    {
      padding = true;
      continue;
    }

    if (padding || !is_call_char(c))
    {
      return false;
    }
    call.push_back(c);
  }

  if (call.empty())
  {
    return false;
  }

  const uint8_t ssid_byte = field[CALLSIGN_LEN];
  out.call = call;
  out.ssid = static_cast<uint8_t>((ssid_byte >> 1) & 0x0F);
  last = (ssid_byte & 0x01) != 0;
  return true;
}

}  // namespace internal
}  // namespace file2afsk

/**
 * @file test_frame.cpp
 * @brief Checksum, AX.25 address and chunk frame codec tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <utility>
#include <vector>

#include "ax25.hpp"
#include "crc16.hpp"
#include "file2afsk/frame.hpp"
#include "file2afsk/protocol.hpp"

using namespace file2afsk;

/* ========================================================================= */
/* CRC16 Tests                                                               */
/* ========================================================================= */

TEST_CASE("CRC16 calculation")
{
  SUBCASE("Empty data")
  {
    const uint8_t* data = nullptr;
    CHECK(internal::calc_crc16(data, 0) == 0xFFFF);
  }

  SUBCASE("Known test vector")
  {
    // CRC-16/CCITT-FALSE check value for "123456789"
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    CHECK(internal::calc_crc16(data, 9) == 0x29B1);
  }

  SUBCASE("Different data produces different CRC")
  {
    const uint8_t data1[] = {0x01, 0x02, 0x03};
    const uint8_t data2[] = {0x01, 0x02, 0x04};
    CHECK(internal::calc_crc16(data1, 3) != internal::calc_crc16(data2, 3));
  }
}

/* ========================================================================= */
/* Callsign / Address Tests                                                  */
/* ========================================================================= */

TEST_CASE("Callsign parsing")
{
  internal::Callsign cs;

  SUBCASE("Plain call")
  {
    REQUIRE(internal::parse_callsign("N0CALL", cs) == ErrorCode::OK);
    CHECK(cs.call == "N0CALL");
    CHECK(cs.ssid == 0);
    CHECK(internal::format_callsign(cs) == "N0CALL");
  }

  SUBCASE("Call with SSID")
  {
    REQUIRE(internal::parse_callsign("n0call-9", cs) == ErrorCode::OK);
    CHECK(cs.call == "N0CALL");
    CHECK(cs.ssid == 9);
    CHECK(internal::format_callsign(cs) == "N0CALL-9");
  }

  SUBCASE("Long call is truncated")
  {
    REQUIRE(internal::parse_callsign("ABCDEFGH", cs) == ErrorCode::OK);
    CHECK(cs.call == "ABCDEF");
  }

  SUBCASE("Invalid calls")
  {
    CHECK(internal::parse_callsign("", cs) == ErrorCode::INVALID_CALLSIGN);
    CHECK(internal::parse_callsign("-5", cs) == ErrorCode::INVALID_CALLSIGN);
    CHECK(internal::parse_callsign("AB_C", cs) == ErrorCode::INVALID_CALLSIGN);
    CHECK(internal::parse_callsign("ABC-", cs) == ErrorCode::INVALID_CALLSIGN);
    CHECK(internal::parse_callsign("ABC-16", cs) == ErrorCode::INVALID_CALLSIGN);
    CHECK(internal::parse_callsign("ABC-1X", cs) == ErrorCode::INVALID_CALLSIGN);
  }
}

TEST_CASE("Address field encoding")
{
  internal::Callsign cs;
  REQUIRE(internal::parse_callsign("N0CALL-9", cs) == ErrorCode::OK);

  std::vector<uint8_t> out;
  internal::encode_address(cs, true, out);

  REQUIRE(out.size() == ADDRESS_LEN);
  CHECK(out[0] == ('N' << 1));
  CHECK(out[1] == ('0' << 1));
  CHECK(out[5] == ('L' << 1));
  CHECK(out[6] == (0x60 | (9 << 1) | 0x01));  // SSID 9, extension bit

  SUBCASE("Short call is space padded")
  {
    internal::Callsign short_cs;
    REQUIRE(internal::parse_callsign("AB", short_cs) == ErrorCode::OK);
    std::vector<uint8_t> padded;
    internal::encode_address(short_cs, false, padded);
    CHECK(padded[2] == (' ' << 1));
    CHECK(padded[5] == (' ' << 1));
    CHECK(padded[6] == 0x60);
  }

  SUBCASE("Decode")
  {
    internal::Callsign decoded;
    bool last = false;
    REQUIRE(internal::decode_address(out.data(), decoded, last));
    CHECK(decoded.call == "N0CALL");
    CHECK(decoded.ssid == 9);
    CHECK(last);
  }

  SUBCASE("Embedded space is rejected")
  {
    out[2] = ' ' << 1;
    internal::Callsign decoded;
    bool last = false;
    CHECK_FALSE(internal::decode_address(out.data(), decoded, last));
  }
}

/* ========================================================================= */
/* Frame Encoding/Decoding Tests                                             */
/* ========================================================================= */

namespace
{

Frame make_frame(uint16_t seq, bool is_last, std::vector<uint8_t> payload)
{
  Frame f;
  f.destination = "AB";
  f.source = "N0CALL-7";
  f.seq = seq;
  f.is_last = is_last;
  f.payload = std::move(payload);
  return f;
}

}  // namespace

TEST_CASE("Frame encoding")
{
  SUBCASE("Header layout")
  {
    std::vector<uint8_t> out;
    REQUIRE(encode_frame(make_frame(0x0102, true, {0xAA, 0xBB}), out) == ErrorCode::OK);

    REQUIRE(out.size() == MIN_FRAME_SIZE + 2);
    CHECK(out[0] == ('A' << 1));
    CHECK(out[1] == ('B' << 1));
    CHECK(out[6] == 0x60);                       // Destination, no extension bit
    CHECK(out[13] == (0x60 | (7 << 1) | 0x01));  // Source, extension bit
    CHECK(out[14] == AX25_CONTROL_UI);
    CHECK(out[15] == AX25_PID_NONE);
    CHECK(out[16] == 0x01);  // SEQ_H
    CHECK(out[17] == 0x02);  // SEQ_L
    CHECK(out[18] == FLAG_LAST);
    CHECK(out[19] == 0xAA);
    CHECK(out[20] == 0xBB);
  }

  SUBCASE("Empty payload")
  {
    std::vector<uint8_t> out;
    REQUIRE(encode_frame(make_frame(0, true, {}), out) == ErrorCode::OK);
    CHECK(out.size() == MIN_FRAME_SIZE);
  }

  SUBCASE("Encoding is deterministic")
  {
    std::vector<uint8_t> first;
    std::vector<uint8_t> second;
    encode_frame(make_frame(5, false, {1, 2, 3}), first);
    encode_frame(make_frame(5, false, {1, 2, 3}), second);
    CHECK(first == second);
  }

  SUBCASE("Payload too large")
  {
    std::vector<uint8_t> out;
    const Frame f = make_frame(0, false, std::vector<uint8_t>(MAX_CHUNK_SIZE + 1, 0x55));
    CHECK(encode_frame(f, out) == ErrorCode::PAYLOAD_TOO_LARGE);
  }

  SUBCASE("Invalid callsign")
  {
    std::vector<uint8_t> out;
    Frame f = make_frame(0, false, {});
    f.source = "BAD CALL";
    CHECK(encode_frame(f, out) == ErrorCode::INVALID_CALLSIGN);
  }
}

TEST_CASE("Frame decoding")
{
  const std::vector<uint8_t> payload = {0x00, 0xC0, 0xDB, 0xFF, 0x10};
  std::vector<uint8_t> raw;
  REQUIRE(encode_frame(make_frame(513, true, payload), raw) == ErrorCode::OK);

  SUBCASE("Round trip")
  {
    Frame f;
    REQUIRE(decode_frame(raw.data(), raw.size(), f) == ErrorCode::OK);
    CHECK(f.destination == "AB");
    CHECK(f.source == "N0CALL-7");
    CHECK(f.seq == 513);
    CHECK(f.is_last);
    CHECK(f.payload == payload);
  }

  SUBCASE("Truncated header")
  {
    Frame f;
    CHECK(decode_frame(raw.data(), MIN_FRAME_SIZE - 1, f) == ErrorCode::MALFORMED_FRAME);
    CHECK(decode_frame(nullptr, 0, f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Invalid callsign character")
  {
    raw[8] = static_cast<uint8_t>('a' << 1);
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Extension bit on destination")
  {
    raw[6] |= 0x01;
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Not a UI frame")
  {
    raw[14] = 0x00;
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Poll/final bit is tolerated")
  {
    raw[14] = AX25_CONTROL_UI | AX25_PF_BIT;
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::OK);
  }

  SUBCASE("Wrong PID")
  {
    raw[15] = 0xCF;
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Reserved flag bits")
  {
    raw[18] = 0x02;
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }
}

TEST_CASE("Frame decoding with digipeater path")
{
  internal::Callsign dest;
  internal::Callsign src;
  internal::Callsign digi;
  REQUIRE(internal::parse_callsign("XY", dest) == ErrorCode::OK);
  REQUIRE(internal::parse_callsign("N0CALL", src) == ErrorCode::OK);
  REQUIRE(internal::parse_callsign("WIDE1-1", digi) == ErrorCode::OK);

  const auto build = [&](size_t digipeaters)
  {
    std::vector<uint8_t> raw;
    internal::encode_address(dest, false, raw);
    internal::encode_address(src, digipeaters == 0, raw);
    for (size_t i = 0; i < digipeaters; ++i)
    {
      internal::encode_address(digi, i + 1 == digipeaters, raw);
    }
    raw.push_back(AX25_CONTROL_UI);
    raw.push_back(AX25_PID_NONE);
    raw.push_back(0x00);
    raw.push_back(0x03);
    raw.push_back(0x00);
    raw.push_back(0x42);
    return raw;
  };

  SUBCASE("Path is skipped")
  {
    const std::vector<uint8_t> raw = build(2);
    Frame f;
    REQUIRE(decode_frame(raw.data(), raw.size(), f) == ErrorCode::OK);
    CHECK(f.destination == "XY");
    CHECK(f.source == "N0CALL");
    CHECK(f.seq == 3);
    CHECK_FALSE(f.is_last);
    REQUIRE(f.payload.size() == 1);
    CHECK(f.payload[0] == 0x42);
  }

  SUBCASE("Too many repeaters")
  {
    const std::vector<uint8_t> raw = build(MAX_DIGIPEATERS + 1);
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }

  SUBCASE("Path runs past the end")
  {
    std::vector<uint8_t> raw = build(0);
    raw[13] &= 0xFE;  // Source claims more addresses follow
    Frame f;
    CHECK(decode_frame(raw.data(), raw.size(), f) == ErrorCode::MALFORMED_FRAME);
  }
}

TEST_CASE("Error messages")
{
  CHECK(std::strcmp(error_message(ErrorCode::OK), "ok") == 0);
  CHECK(std::strcmp(error_message(ErrorCode::MALFORMED_FRAME), "malformed frame") == 0);
}

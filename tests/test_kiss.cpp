/**
 * @file test_kiss.cpp
 * @brief KISS codec, transport and C API tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <vector>

#include "file2afsk/file2afsk.h"
#include "file2afsk/kiss.hpp"
#include "file2afsk/kiss_transport.hpp"
#include "file2afsk/protocol.hpp"
#include "file2afsk/transport.hpp"

using namespace file2afsk;

namespace
{

struct Collected
{
  std::vector<std::vector<uint8_t>> frames;
  std::vector<uint8_t> ports;
};

KissDecoder::FrameFn collect_into(Collected& c)
{
  return [&c](uint8_t port, const uint8_t* data, size_t len)
  {
    c.ports.push_back(port);
    c.frames.emplace_back(data, data + len);
  };
}

std::vector<uint8_t> encoded(const std::vector<uint8_t>& frame, uint8_t port = 0)
{
  std::vector<uint8_t> out;
  kiss_encode(frame.data(), frame.size(), port, out);
  return out;
}

}  // namespace

/* ========================================================================= */
/* Escaping Tests                                                            */
/* ========================================================================= */

TEST_CASE("KISS escaping")
{
  SUBCASE("Special bytes")
  {
    const uint8_t data[] = {FEND, FESC, 0x01};
    std::vector<uint8_t> out;
    kiss_escape(data, sizeof(data), out);

    const std::vector<uint8_t> expected = {FESC, TFEND, FESC, TFESC, 0x01};
    CHECK(out == expected);
  }

  SUBCASE("Round trip over every byte value")
  {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i)
    {
      data.push_back(static_cast<uint8_t>(i));
    }
    data.push_back(FESC);
    data.push_back(TFEND);
    data.push_back(FEND);

    std::vector<uint8_t> escaped;
    kiss_escape(data.data(), data.size(), escaped);
    CHECK(std::find(escaped.begin(), escaped.end(), FEND) == escaped.end());

    std::vector<uint8_t> restored;
    REQUIRE(kiss_unescape(escaped.data(), escaped.size(), restored));
    CHECK(restored == data);
  }

  SUBCASE("Invalid escape sequences")
  {
    std::vector<uint8_t> out;
    const uint8_t dangling[] = {0x01, FESC};
    CHECK_FALSE(kiss_unescape(dangling, sizeof(dangling), out));

    const uint8_t unknown[] = {FESC, 0x01};
    CHECK_FALSE(kiss_unescape(unknown, sizeof(unknown), out));
  }
}

TEST_CASE("KISS encoding")
{
  SUBCASE("Port 0 data frame")
  {
    const std::vector<uint8_t> out = encoded({0x10, FEND, 0x20});
    const std::vector<uint8_t> expected = {FEND, 0x00, 0x10, FESC, TFEND, 0x20, FEND};
    CHECK(out == expected);
  }

  SUBCASE("Port in high nibble")
  {
    const std::vector<uint8_t> out = encoded({0x10}, 2);
    REQUIRE(out.size() == 4);
    CHECK(out[1] == 0x20);
  }
}

/* ========================================================================= */
/* Decoder Tests                                                             */
/* ========================================================================= */

TEST_CASE("KISS decoder")
{
  Collected c;
  KissDecoder decoder(collect_into(c));

  SUBCASE("Single frame")
  {
    const std::vector<uint8_t> wire = encoded({1, 2, 3});
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0] == std::vector<uint8_t>{1, 2, 3});
    CHECK(c.ports[0] == 0);
  }

  SUBCASE("Escapes split across feeds")
  {
    const std::vector<uint8_t> wire = encoded({FEND, FESC, 0x42});
    for (const uint8_t byte : wire)
    {
      decoder.feed(&byte, 1);
    }

    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0] == std::vector<uint8_t>{FEND, FESC, 0x42});
  }

  SUBCASE("Shared delimiter between frames")
  {
    // FEND 00 A FEND 00 B FEND
    const std::vector<uint8_t> wire = {FEND, 0x00, 0xAA, FEND, 0x00, 0xBB, FEND};
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.frames.size() == 2);
    CHECK(c.frames[0] == std::vector<uint8_t>{0xAA});
    CHECK(c.frames[1] == std::vector<uint8_t>{0xBB});
  }

  SUBCASE("Idle FENDs and leading garbage")
  {
    const std::vector<uint8_t> wire = {0x12, 0x34, FEND, FEND, FEND, 0x00, 0x55, FEND};
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0] == std::vector<uint8_t>{0x55});
    CHECK(decoder.dropped_frames() == 0);
  }

  SUBCASE("Invalid escape drops only that frame")
  {
    std::vector<uint8_t> wire = {FEND, 0x00, 0x01, FESC, 0x02, 0x03, FEND};
    const std::vector<uint8_t> good = encoded({0x77});
    wire.insert(wire.end(), good.begin(), good.end());
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0] == std::vector<uint8_t>{0x77});
    CHECK(decoder.dropped_frames() == 1);
  }

  SUBCASE("Non-data commands are ignored")
  {
    const std::vector<uint8_t> wire = {FEND, 0x01, 0x32, FEND};  // TXDELAY
    decoder.feed(wire.data(), wire.size());

    CHECK(c.frames.empty());
    CHECK(decoder.dropped_frames() == 1);
  }

  SUBCASE("Port is reported")
  {
    const std::vector<uint8_t> wire = encoded({0x01}, 3);
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.ports.size() == 1);
    CHECK(c.ports[0] == 3);
  }

  SUBCASE("Reset discards partial frame")
  {
    const std::vector<uint8_t> partial = {FEND, 0x00, 0x01, 0x02};
    decoder.feed(partial.data(), partial.size());
    decoder.reset();

    const std::vector<uint8_t> wire = encoded({0x09});
    decoder.feed(wire.data(), wire.size());

    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0] == std::vector<uint8_t>{0x09});
  }
}

TEST_CASE("KISS decoder oversize protection")
{
  Collected c;
  KissDecoder decoder(collect_into(c), 8);

  // Unterminated run of data, then a valid frame
  std::vector<uint8_t> wire = {FEND, 0x00};
  wire.insert(wire.end(), 20, 0x11);
  const std::vector<uint8_t> good = encoded({0x22, 0x33});
  wire.insert(wire.end(), good.begin(), good.end());
  decoder.feed(wire.data(), wire.size());

  REQUIRE(c.frames.size() == 1);
  CHECK(c.frames[0] == std::vector<uint8_t>{0x22, 0x33});
  CHECK(decoder.dropped_frames() == 1);
}

/* ========================================================================= */
/* KissTransport Tests                                                       */
/* ========================================================================= */

TEST_CASE("KissTransport over loopback")
{
  // Three-byte reads force frames and escapes across read boundaries
  LoopbackTransport loop(3);
  KissTransport kiss(loop);

  const std::vector<uint8_t> first = {0x01, FEND, 0x02, FESC, 0x03};
  const std::vector<uint8_t> second = {0xF0, 0x0F};
  REQUIRE(kiss.send(first) == ErrorCode::OK);
  REQUIRE(kiss.send(second) == ErrorCode::OK);

  std::vector<uint8_t> out;
  REQUIRE(kiss.next_frame(out, 0) == ErrorCode::OK);
  CHECK(out == first);
  REQUIRE(kiss.next_frame(out, 0) == ErrorCode::OK);
  CHECK(out == second);

  SUBCASE("Empty pipe times out")
  {
    CHECK(kiss.next_frame(out, 0) == ErrorCode::TIMEOUT);
  }

  SUBCASE("Closed pipe ends the stream")
  {
    loop.close_when_drained();
    CHECK(kiss.next_frame(out, 0) == ErrorCode::TRANSPORT_CLOSED);
  }

  SUBCASE("Frames for other ports are dropped")
  {
    loop.inject(encoded({0x01}, 1));
    loop.inject(encoded({0x02}, 0));
    REQUIRE(kiss.next_frame(out, 0) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>{0x02});
    CHECK(kiss.dropped_frames() == 1);
  }

  SUBCASE("Write failure")
  {
    loop.fail_writes(true);
    CHECK(kiss.send(first) == ErrorCode::TRANSPORT_UNAVAILABLE);
  }

  SUBCASE("Close releases the transport")
  {
    kiss.close();
    CHECK_FALSE(loop.is_open());
    CHECK(kiss.send(first) == ErrorCode::TRANSPORT_UNAVAILABLE);
  }
}

/* ========================================================================= */
/* FdTransport Tests                                                         */
/* ========================================================================= */

TEST_CASE("FdTransport over a socket pair")
{
  int sv[2];
  REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

  FdTransport a(sv[0], true);
  FdTransport b(sv[1], true);

  const uint8_t msg[] = {FEND, 0x00, 0x41, FEND};
  REQUIRE(a.write(msg, sizeof(msg)) == ErrorCode::OK);

  uint8_t buf[16];
  size_t received = 0;
  REQUIRE(b.read(buf, sizeof(buf), received, 1000) == ErrorCode::OK);
  CHECK(received == sizeof(msg));
  CHECK(std::memcmp(buf, msg, sizeof(msg)) == 0);

  SUBCASE("No data times out")
  {
    CHECK(b.read(buf, sizeof(buf), received, 10) == ErrorCode::TIMEOUT);
    CHECK(received == 0);
  }

  SUBCASE("Peer close ends the stream")
  {
    a.close();
    CHECK_FALSE(a.is_open());
    CHECK(b.read(buf, sizeof(buf), received, 1000) == ErrorCode::TRANSPORT_CLOSED);
    CHECK(a.write(msg, sizeof(msg)) == ErrorCode::TRANSPORT_UNAVAILABLE);
  }

  SUBCASE("Frames through KissTransport")
  {
    KissTransport tx(a);
    KissTransport rx(b);
    const std::vector<uint8_t> frame = {0xDB, 0xC0, 0x00};
    REQUIRE(tx.send(frame) == ErrorCode::OK);

    std::vector<uint8_t> out;
    REQUIRE(rx.next_frame(out, 1000) == ErrorCode::OK);
    CHECK(out == frame);
  }
}

TEST_CASE("TCP factory connects to a listening TNC")
{
  const int listener = socket(AF_INET, SOCK_STREAM, 0);
  REQUIRE(listener >= 0);

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  REQUIRE(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  REQUIRE(listen(listener, 1) == 0);

  socklen_t addr_len = sizeof(addr);
  REQUIRE(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0);

  std::unique_ptr<Transport> t;
  REQUIRE(open_tcp("127.0.0.1", ntohs(addr.sin_port), 1000, t) == ErrorCode::OK);
  REQUIRE(t != nullptr);
  CHECK(t->is_open());

  const int peer = accept(listener, nullptr, nullptr);
  REQUIRE(peer >= 0);
  FdTransport tnc(peer, true);

  KissTransport host_side(*t);
  KissTransport tnc_side(tnc);
  const std::vector<uint8_t> frame = {0x41, FEND, 0x42};
  REQUIRE(host_side.send(frame) == ErrorCode::OK);

  std::vector<uint8_t> out;
  REQUIRE(tnc_side.next_frame(out, 1000) == ErrorCode::OK);
  CHECK(out == frame);

  t->close();
  CHECK_FALSE(t->is_open());
  ::close(listener);
}

TEST_CASE("Transport factories report unavailable endpoints")
{
  std::unique_ptr<Transport> t;

  SUBCASE("Serial: unsupported baud rate")
  {
    CHECK(open_serial("/dev/null", 1234, t) == ErrorCode::INVALID_ARGUMENT);
  }

  SUBCASE("Serial: missing device")
  {
    CHECK(open_serial("/nonexistent/tty", 9600, t) == ErrorCode::TRANSPORT_UNAVAILABLE);
  }

  SUBCASE("TCP: unresolvable host")
  {
    CHECK(open_tcp("host.invalid", DEFAULT_KISS_PORT, 500, t) ==
          ErrorCode::TRANSPORT_UNAVAILABLE);
  }

  CHECK(t == nullptr);
}

/* ========================================================================= */
/* C API Tests                                                               */
/* ========================================================================= */

namespace
{

void c_collect(void* user, uint8_t port, const uint8_t* data, size_t len)
{
  (void)port;
  static_cast<std::vector<std::vector<uint8_t>>*>(user)->emplace_back(data, data + len);
}

}  // namespace

TEST_CASE("C API")
{
  SUBCASE("Error strings")
  {
    CHECK(std::strcmp(file2afsk_strerror(FILE2AFSK_ERR_OK), "ok") == 0);
    CHECK(std::strcmp(file2afsk_strerror(FILE2AFSK_ERR_MALFORMED_FRAME), "malformed frame") == 0);
  }

  SUBCASE("Create requires a callback")
  {
    CHECK(file2afsk_decoder_create(nullptr, nullptr, 0) == nullptr);
  }

  SUBCASE("Encode and decode")
  {
    const uint8_t frame[] = {0x01, FILE2AFSK_FEND, 0x02};
    uint8_t wire[16];
    size_t wire_len = 0;
    REQUIRE(file2afsk_kiss_encode(frame, sizeof(frame), 0, wire, sizeof(wire), &wire_len) ==
            FILE2AFSK_ERR_OK);
    CHECK(wire_len == 7);

    std::vector<std::vector<uint8_t>> frames;
    File2afskDecoder* decoder = file2afsk_decoder_create(c_collect, &frames, 0);
    REQUIRE(decoder != nullptr);

    for (size_t i = 0; i < wire_len; ++i)
    {
      file2afsk_decoder_feed_byte(decoder, wire[i]);
    }

    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == std::vector<uint8_t>{0x01, FILE2AFSK_FEND, 0x02});
    CHECK(file2afsk_decoder_dropped(decoder) == 0);

    file2afsk_decoder_reset(decoder);
    file2afsk_decoder_destroy(decoder);
  }

  SUBCASE("Encode into a short buffer")
  {
    const uint8_t frame[] = {FILE2AFSK_FEND, FILE2AFSK_FEND, FILE2AFSK_FEND};
    uint8_t wire[6];
    size_t wire_len = 0;
    CHECK(file2afsk_kiss_encode(frame, sizeof(frame), 0, wire, sizeof(wire), &wire_len) ==
          FILE2AFSK_ERR_PAYLOAD_TOO_LARGE);
    CHECK(file2afsk_kiss_encode(frame, sizeof(frame), 0, nullptr, 0, &wire_len) ==
          FILE2AFSK_ERR_INVALID_ARGUMENT);
  }

  SUBCASE("NULL-safe operations")
  {
    file2afsk_decoder_feed_byte(nullptr, 0x00);
    file2afsk_decoder_reset(nullptr);
    file2afsk_decoder_destroy(nullptr);
    CHECK(file2afsk_decoder_dropped(nullptr) == 0);
  }
}

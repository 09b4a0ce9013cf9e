/**
 * @file transport.cpp
 * @brief Byte-stream channel implementations
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/transport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

namespace file2afsk
{

namespace
{

bool set_nonblocking(int fd, bool enable)
{
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
  {
    return false;
  }
  const int wanted = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return fcntl(fd, F_SETFL, wanted) == 0;
}

// Non-blocking connect bounded by timeout_ms, leaves the socket blocking
bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t addr_len, int timeout_ms)
{
  if (!set_nonblocking(fd, true))
  {
    return false;
  }

  if (connect(fd, addr, addr_len) != 0)
  {
    if (errno != EINPROGRESS)
    {
      return false;
    }

    pollfd pfd = {fd, POLLOUT, 0};
    int ready;
    do
    {
      ready = poll(&pfd, 1, timeout_ms);
    } while (ready < 0 && errno == EINTR);

    if (ready <= 0)
    {
      return false;
    }

    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0)
    {
      return false;
    }
  }

  return set_nonblocking(fd, false);
}

speed_t baud_to_speed(uint32_t baud)
{
  switch (baud)
  {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    default:
      return B0;
  }
}

}  // namespace

/* ========================================================================= */
/* FdTransport                                                               */
/* ========================================================================= */

FdTransport::FdTransport(int fd, bool socket) : fd_(fd), socket_(socket) {}

FdTransport::~FdTransport()
{
  close();
}

ErrorCode FdTransport::write(const uint8_t* data, size_t len)
{
  if (fd_ < 0)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  size_t sent = 0;
  while (sent < len)
  {
    const ssize_t n = socket_ ? ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL)
                              : ::write(fd_, data + sent, len - sent);
    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      return ErrorCode::TRANSPORT_UNAVAILABLE;
    }
    sent += static_cast<size_t>(n);
  }

  return ErrorCode::OK;
}

ErrorCode FdTransport::read(uint8_t* buf, size_t cap, size_t& received, int timeout_ms)
{
  received = 0;
  if (fd_ < 0)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  pollfd pfd = {fd_, POLLIN, 0};
  const int ready = poll(&pfd, 1, timeout_ms);
  if (ready < 0)
  {
    // A signal interrupted the wait; let the caller check for cancellation
    return errno == EINTR ? ErrorCode::TIMEOUT : ErrorCode::TRANSPORT_UNAVAILABLE;
  }
  if (ready == 0)
  {
    return ErrorCode::TIMEOUT;
  }

  const ssize_t n = ::read(fd_, buf, cap);
  if (n == 0)
  {
    return ErrorCode::TRANSPORT_CLOSED;
  }
  if (n < 0)
  {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
    {
      return ErrorCode::TIMEOUT;
    }
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  received = static_cast<size_t>(n);
  return ErrorCode::OK;
}

void FdTransport::close()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

/* ========================================================================= */
/* Factories                                                                 */
/* ========================================================================= */

ErrorCode open_tcp(const std::string& host, uint16_t port, int timeout_ms,
                   std::unique_ptr<Transport>& out)
{
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  int fd = -1;
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next)
  {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
    {
      continue;
    }

    if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms))
    {
      break;
    }

    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(result);

  if (fd < 0)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  // KISS frames are small; do not let Nagle hold them back
  const int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  out = std::make_unique<FdTransport>(fd, true);
  return ErrorCode::OK;
}

ErrorCode open_serial(const std::string& device, uint32_t baud, std::unique_ptr<Transport>& out)
{
  const speed_t speed = baud_to_speed(baud);
  if (speed == B0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  const int fd = open(device.c_str(), O_RDWR | O_NOCTTY);
  if (fd < 0)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  termios tio;
  if (tcgetattr(fd, &tio) != 0)
  {
    ::close(fd);
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN] = 1;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(fd, TCSANOW, &tio) != 0)
  {
    ::close(fd);
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  out = std::make_unique<FdTransport>(fd, false);
  return ErrorCode::OK;
}

/* ========================================================================= */
/* LoopbackTransport                                                         */
/* ========================================================================= */

LoopbackTransport::LoopbackTransport(size_t max_read)
    : pipe_(), max_read_(max_read == 0 ? 1 : max_read), open_(true), eof_(false),
      fail_writes_(false)
{
}

ErrorCode LoopbackTransport::write(const uint8_t* data, size_t len)
{
  if (!open_ || fail_writes_)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  pipe_.insert(pipe_.end(), data, data + len);
  return ErrorCode::OK;
}

ErrorCode LoopbackTransport::read(uint8_t* buf, size_t cap, size_t& received, int timeout_ms)
{
  (void)timeout_ms;
  received = 0;

  if (!open_)
  {
    return ErrorCode::TRANSPORT_UNAVAILABLE;
  }

  if (pipe_.empty())
  {
    return eof_ ? ErrorCode::TRANSPORT_CLOSED : ErrorCode::TIMEOUT;
  }

  const size_t n = std::min(std::min(cap, max_read_), pipe_.size());
  std::copy(pipe_.begin(), pipe_.begin() + static_cast<std::ptrdiff_t>(n), buf);
  pipe_.erase(pipe_.begin(), pipe_.begin() + static_cast<std::ptrdiff_t>(n));
  received = n;
  return ErrorCode::OK;
}

void LoopbackTransport::close()
{
  open_ = false;
}

void LoopbackTransport::inject(const std::vector<uint8_t>& bytes)
{
  pipe_.insert(pipe_.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> LoopbackTransport::pending() const
{
  return std::vector<uint8_t>(pipe_.begin(), pipe_.end());
}

}  // namespace file2afsk

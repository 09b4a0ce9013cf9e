/**
 * @file transmitter.cpp
 * @brief File chunking and frame transmission implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/transmitter.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <thread>

#include "crc16.hpp"

namespace file2afsk
{

namespace
{

constexpr char ALPHANUM[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr size_t ALPHANUM_LEN = sizeof(ALPHANUM) - 1;

}  // namespace

ErrorCode split_chunks(const std::vector<uint8_t>& data, size_t chunk_size,
                       std::vector<Chunk>& out)
{
  if (chunk_size < MIN_CHUNK_SIZE || chunk_size > MAX_CHUNK_SIZE)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  const size_t total = data.empty() ? 1 : (data.size() + chunk_size - 1) / chunk_size;
  if (total > MAX_CHUNKS)
  {
    return ErrorCode::FILE_TOO_LARGE;
  }

  out.clear();
  out.reserve(total);

  for (size_t i = 0; i < total; ++i)
  {
    const size_t offset = i * chunk_size;
    const size_t len = std::min(chunk_size, data.size() - offset);

    Chunk c;
    c.seq = static_cast<uint16_t>(i);
    c.is_last = (i == total - 1);
    c.payload.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                     data.begin() + static_cast<std::ptrdiff_t>(offset + len));
    out.push_back(std::move(c));
  }

  return ErrorCode::OK;
}

std::string file_id_for(const std::string& path)
{
  const size_t slash = path.find_last_of('/');
  const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

  const uint16_t crc =
      internal::calc_crc16(reinterpret_cast<const uint8_t*>(name.data()), name.size());

  std::string id;
  id.push_back(ALPHANUM[((crc >> 8) & 0xFF) % ALPHANUM_LEN]);
  id.push_back(ALPHANUM[(crc & 0xFF) % ALPHANUM_LEN]);
  return id;
}

ErrorCode read_file(const std::string& path, std::vector<uint8_t>& out)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    return ErrorCode::FILE_ERROR;
  }

  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad())
  {
    return ErrorCode::FILE_ERROR;
  }

  return ErrorCode::OK;
}

Transmitter::Transmitter(KissTransport& kiss, TransmitterConfig config)
    : kiss_(kiss), config_(std::move(config)), progress_(), frames_sent_(0)
{
}

ErrorCode Transmitter::transmit_file(const std::string& path)
{
  std::vector<uint8_t> data;
  const ErrorCode rc = read_file(path, data);
  if (rc != ErrorCode::OK)
  {
    return rc;
  }

  const std::string destination =
      config_.destination.empty() ? file_id_for(path) : config_.destination;
  return transmit(data, destination);
}

ErrorCode Transmitter::transmit(const std::vector<uint8_t>& data, const std::string& destination)
{
  std::vector<Chunk> chunks;
  ErrorCode rc = split_chunks(data, config_.chunk_size, chunks);
  if (rc != ErrorCode::OK)
  {
    return rc;
  }

  Frame frame;
  frame.destination = destination;
  frame.source = config_.source;

  std::vector<uint8_t> encoded;
  for (const Chunk& chunk : chunks)
  {
    frame.seq = chunk.seq;
    frame.is_last = chunk.is_last;
    frame.payload = chunk.payload;

    rc = encode_frame(frame, encoded);
    if (rc != ErrorCode::OK)
    {
      return rc;
    }

    rc = kiss_.send(encoded);
    if (rc != ErrorCode::OK)
    {
      return rc;
    }
    ++frames_sent_;

    if (progress_)
    {
      progress_(chunk, chunks.size());
    }

    if (config_.frame_delay.count() > 0)
    {
      std::this_thread::sleep_for(config_.frame_delay);
    }
  }

  return ErrorCode::OK;
}

}  // namespace file2afsk

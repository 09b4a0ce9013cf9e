/**
 * @file transmitter.hpp
 * @brief File chunking and frame transmission
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "file2afsk/frame.hpp"
#include "file2afsk/kiss_transport.hpp"
#include "file2afsk/protocol.hpp"

namespace file2afsk
{

/**
 * @brief A bounded slice of the source file
 */
struct Chunk
{
  uint16_t seq;
  bool is_last;
  std::vector<uint8_t> payload;
};

/**
 * @brief Split data into sequence-numbered chunks
 *
 * An empty input yields a single empty chunk flagged as last, so that a
 * receiver can still observe the transfer.
 *
 * @param data       Source bytes
 * @param chunk_size Maximum payload per chunk (MIN_CHUNK_SIZE..MAX_CHUNK_SIZE)
 * @param out        Chunks in file order (cleared first)
 * @return ErrorCode::OK, ErrorCode::INVALID_ARGUMENT for an out-of-range
 *         chunk size, or ErrorCode::FILE_TOO_LARGE when more than
 *         MAX_CHUNKS chunks would be needed
 */
ErrorCode split_chunks(const std::vector<uint8_t>& data, size_t chunk_size,
                       std::vector<Chunk>& out);

/**
 * @brief Derive the two-character file identifier from a file name
 *
 * Only the base name is used, so the same file sent from different
 * directories keeps its identifier.
 */
std::string file_id_for(const std::string& path);

/**
 * @brief Read a whole file into memory
 *
 * @return ErrorCode::OK or ErrorCode::FILE_ERROR
 */
ErrorCode read_file(const std::string& path, std::vector<uint8_t>& out);

struct TransmitterConfig
{
  std::string source = "N0CALL";                ///< Sender callsign
  std::string destination;                      ///< File identifier, derived when empty
  size_t chunk_size = DEFAULT_CHUNK_SIZE;       ///< Payload bytes per frame
  std::chrono::milliseconds frame_delay{0};     ///< Pause after each frame
};

/**
 * @brief One-shot, connectionless file sender
 */
class Transmitter
{
 public:
  /**
   * @brief Progress callback, invoked after each frame is handed to the TNC
   *
   * @param chunk Chunk just sent
   * @param total Number of chunks in the transfer
   */
  using ProgressFn = std::function<void(const Chunk& chunk, size_t total)>;

  Transmitter(KissTransport& kiss, TransmitterConfig config);

  void set_progress(ProgressFn fn)
  {
    progress_ = std::move(fn);
  }

  /**
   * @brief Read and send a file
   *
   * Uses file_id_for(path) as destination unless one is configured.
   */
  ErrorCode transmit_file(const std::string& path);

  /**
   * @brief Send a byte buffer as one transfer
   *
   * Frames go out strictly in sequence order; each send completes before
   * the next chunk is encoded.
   *
   * @param data        Bytes to send
   * @param destination File identifier placed in the destination address
   */
  ErrorCode transmit(const std::vector<uint8_t>& data, const std::string& destination);

  const TransmitterConfig& config() const
  {
    return config_;
  }

  size_t frames_sent() const
  {
    return frames_sent_;
  }

 private:
  KissTransport& kiss_;
  TransmitterConfig config_;
  ProgressFn progress_;
  size_t frames_sent_;
};

}  // namespace file2afsk

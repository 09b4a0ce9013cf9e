/**
 * @file reassembler.hpp
 * @brief Receive-side session buffer and completion tracking
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "file2afsk/frame.hpp"
#include "file2afsk/protocol.hpp"

namespace file2afsk
{

enum class SessionState
{
  IDLE,        // Nothing buffered
  COLLECTING,  // Frames buffered, terminal marker not seen
  COMPLETE,    // Terminal marker seen (gaps may remain)
};

/**
 * @brief How lost chunks are represented in the assembled file
 */
enum class GapPolicy
{
  SKIP,       // Concatenate what arrived; output is shorter than the original
  ZERO_FILL,  // Replace each lost chunk with chunk_size zero bytes
};

/**
 * @brief Reassembly buffer for one transfer
 */
struct Session
{
  std::string source;
  std::string destination;
  std::map<uint16_t, std::vector<uint8_t>> chunks;  ///< seq -> payload
  SessionState state = SessionState::IDLE;
  uint16_t last_seq = 0;     ///< Sequence carrying the terminal marker, valid when COMPLETE
  uint16_t highest_seq = 0;  ///< Highest sequence observed, valid unless IDLE
  size_t frames = 0;         ///< Frames accepted, duplicates included
  size_t duplicates = 0;

  /**
   * @brief Number of sequence indices expected so far
   *
   * last_seq + 1 once the marker is seen, otherwise highest_seq + 1.
   */
  size_t expected_chunks() const;

  /**
   * @brief Sequence indices below expected_chunks() that never arrived
   */
  std::vector<uint16_t> missing() const;

  bool matches(const Frame& frame) const
  {
    return state != SessionState::IDLE && frame.source == source &&
           frame.destination == destination;
  }

  void reset();
};

struct ReassemblerConfig
{
  GapPolicy gap_policy = GapPolicy::SKIP;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;  ///< Fill size for GapPolicy::ZERO_FILL
};

/**
 * @brief Buffers chunks of one transfer by sequence number
 *
 * Frames of another transfer restart the session. Receiver keeps one
 * Reassembler per (source, destination) so it never mixes transfers.
 */
class Reassembler
{
 public:
  enum class Result
  {
    STORED,     // New sequence index buffered
    DUPLICATE,  // Sequence index already present, payload replaced
    COMPLETED,  // Terminal marker stored
  };

  explicit Reassembler(ReassemblerConfig config = ReassemblerConfig());

  /**
   * @brief Buffer one decoded frame
   *
   * Duplicate sequence indices overwrite the earlier payload, so repeated
   * delivery never adds bytes.
   */
  Result accept(const Frame& frame);

  /**
   * @brief Concatenate buffered chunks in sequence order
   *
   * @param out Assembled bytes (cleared first), filled even on a partial
   *            transfer
   * @return ErrorCode::OK when the marker was seen and no chunk is missing,
   *         ErrorCode::PARTIAL_TRANSFER otherwise
   */
  ErrorCode assemble(std::vector<uint8_t>& out) const;

  void reset()
  {
    session_.reset();
  }

  const Session& session() const
  {
    return session_;
  }

  const ReassemblerConfig& config() const
  {
    return config_;
  }

 private:
  ReassemblerConfig config_;
  Session session_;
};

}  // namespace file2afsk

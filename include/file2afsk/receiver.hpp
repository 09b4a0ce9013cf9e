/**
 * @file receiver.hpp
 * @brief Receive loop: KISS frames in, reassembled files out
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "file2afsk/frame.hpp"
#include "file2afsk/kiss_transport.hpp"
#include "file2afsk/protocol.hpp"
#include "file2afsk/reassembler.hpp"

namespace file2afsk
{

struct ReceiverConfig
{
  /**
   * @brief Accepted sender, empty accepts everyone
   *
   * "CALL" matches any SSID of CALL, "CALL-N" matches exactly.
   */
  std::string source_filter;
  std::string output_dir = ".";
  GapPolicy gap_policy = GapPolicy::SKIP;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;  ///< Fill size for GapPolicy::ZERO_FILL
  bool continuous = false;                 ///< Keep listening after a completed file
  int poll_timeout_ms = DEFAULT_POLL_TIMEOUT_MS;
};

/**
 * @brief What happened to one received KISS frame
 */
enum class FrameStatus
{
  STORED,     // Buffered under a new sequence index
  DUPLICATE,  // Replaced an already buffered sequence index
  COMPLETED,  // Terminal marker, file written
  MALFORMED,  // Failed to decode, discarded
  FILTERED,   // Source did not match the filter, discarded
  IGNORED,    // Late repeat of an already written transfer, discarded
};

/**
 * @brief A written output file
 */
struct ReceivedFile
{
  std::string path;
  std::string source;
  std::string destination;
  size_t bytes;
  size_t chunks;    ///< Distinct sequence indices received
  size_t missing;   ///< Sequence indices never received
  bool complete;    ///< Terminal marker seen and nothing missing
};

struct ReceiverStats
{
  size_t frames = 0;     ///< KISS frames handed to the receiver
  size_t malformed = 0;
  size_t filtered = 0;
  size_t ignored = 0;
};

/**
 * @brief Check a decoded source callsign against a filter
 */
bool source_matches(const std::string& filter, const std::string& source);

/**
 * @brief Output file name for a transfer
 *
 * Format: received_<DEST>_from_<SOURCE>_<YYYYMMDD-HHMMSS>.bin (UTC)
 */
std::string output_filename(const std::string& destination, const std::string& source,
                            std::time_t when);

/**
 * @brief Reassembles transfers from a KISS stream and writes them to disk
 *
 * Each (source, destination) pair is buffered separately, so transfers from
 * several stations may interleave on the channel.
 *
 * Example usage:
 * @code
 * std::atomic<bool> stop(false);   // set from a SIGINT handler
 * KissTransport kiss(*tcp);
 * Receiver rx(kiss, ReceiverConfig(), stop);
 * ErrorCode rc = rx.run();
 * for (const ReceivedFile& f : rx.files()) { ... }
 * @endcode
 */
class Receiver
{
 public:
  using FrameFn = std::function<void(FrameStatus status, const Frame& frame)>;
  using FileFn = std::function<void(const ReceivedFile& file)>;

  /**
   * @param kiss   Frame source, closed when run() returns
   * @param config Receiver settings
   * @param cancel Checked before every read; set it to stop run()
   */
  Receiver(KissTransport& kiss, ReceiverConfig config, const std::atomic<bool>& cancel);

  void set_frame_callback(FrameFn fn)
  {
    on_frame_ = std::move(fn);
  }

  void set_file_callback(FileFn fn)
  {
    on_file_ = std::move(fn);
  }

  /**
   * @brief Receive until a transfer completes, the stream ends or cancel is set
   *
   * Whatever is buffered is written out and the transport is closed on
   * every exit path.
   *
   * @return ErrorCode::OK on completion or cancellation,
   *         ErrorCode::TRANSPORT_CLOSED / TRANSPORT_UNAVAILABLE when the
   *         stream ended, ErrorCode::FILE_ERROR if an output file could not
   *         be written
   */
  ErrorCode run();

  /**
   * @brief Process one raw AX.25 frame
   *
   * @return ErrorCode::OK (stored, duplicate, completed, filtered or
   *         ignored), ErrorCode::MALFORMED_FRAME, or ErrorCode::FILE_ERROR
   *         when completing the transfer failed to write its file
   */
  ErrorCode handle_frame(const std::vector<uint8_t>& raw);

  /**
   * @brief Write every buffered session and drop the ones written
   *
   * A session whose file could not be written stays buffered.
   *
   * @return ErrorCode::OK or ErrorCode::FILE_ERROR
   */
  ErrorCode flush();

  /**
   * @brief True once a transfer completed in non-continuous mode
   */
  bool finished() const
  {
    return finished_;
  }

  const std::vector<ReceivedFile>& files() const
  {
    return files_;
  }

  const ReceiverStats& stats() const
  {
    return stats_;
  }

  /**
   * @brief Number of transfers buffered and not yet written
   */
  size_t active_sessions() const
  {
    return sessions_.size();
  }

  /**
   * @brief Buffered session of one transfer, nullptr if none
   */
  const Session* session(const std::string& source, const std::string& destination) const;

 private:
  using SessionKey = std::pair<std::string, std::string>;  // (source, destination)
  using SessionMap = std::map<SessionKey, Reassembler>;

  ErrorCode receive_loop();
  ErrorCode write_session(SessionMap::iterator it);
  std::string next_output_path(const Session& session) const;
  void notify(FrameStatus status, const Frame& frame);

  KissTransport& kiss_;
  ReceiverConfig config_;
  const std::atomic<bool>& cancel_;
  SessionMap sessions_;
  std::set<SessionKey> completed_;  ///< Written transfers (continuous mode)
  FrameFn on_frame_;
  FileFn on_file_;
  std::vector<ReceivedFile> files_;
  ReceiverStats stats_;
  bool finished_;
};

}  // namespace file2afsk

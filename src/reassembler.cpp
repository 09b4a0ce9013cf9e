/**
 * @file reassembler.cpp
 * @brief Receive-side session buffer implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/reassembler.hpp"

namespace file2afsk
{

size_t Session::expected_chunks() const
{
  if (state == SessionState::IDLE)
  {
    return 0;
  }
  return static_cast<size_t>(state == SessionState::COMPLETE ? last_seq : highest_seq) + 1;
}

std::vector<uint16_t> Session::missing() const
{
  std::vector<uint16_t> gaps;
  const size_t expected = expected_chunks();

  for (size_t seq = 0; seq < expected; ++seq)
  {
    if (chunks.find(static_cast<uint16_t>(seq)) == chunks.end())
    {
      gaps.push_back(static_cast<uint16_t>(seq));
    }
  }

  return gaps;
}

void Session::reset()
{
  source.clear();
  destination.clear();
  chunks.clear();
  state = SessionState::IDLE;
  last_seq = 0;
  highest_seq = 0;
  frames = 0;
  duplicates = 0;
}

Reassembler::Reassembler(ReassemblerConfig config) : config_(config), session_() {}

Reassembler::Result Reassembler::accept(const Frame& frame)
{
  if (session_.state != SessionState::IDLE && !session_.matches(frame))
  {
    session_.reset();
  }

  if (session_.state == SessionState::IDLE)
  {
    session_.source = frame.source;
    session_.destination = frame.destination;
    session_.state = SessionState::COLLECTING;
    session_.highest_seq = frame.seq;
  }

  ++session_.frames;
  if (frame.seq > session_.highest_seq)
  {
    session_.highest_seq = frame.seq;
  }

  // Last write wins
  const bool duplicate = session_.chunks.count(frame.seq) != 0;
  session_.chunks[frame.seq] = frame.payload;
  if (duplicate)
  {
    ++session_.duplicates;
  }

  if (frame.is_last)
  {
    session_.last_seq = frame.seq;
    session_.state = SessionState::COMPLETE;
    return Result::COMPLETED;
  }

  return duplicate ? Result::DUPLICATE : Result::STORED;
}

ErrorCode Reassembler::assemble(std::vector<uint8_t>& out) const
{
  out.clear();

  size_t next = 0;
  for (const auto& entry : session_.chunks)
  {
    if (config_.gap_policy == GapPolicy::ZERO_FILL)
    {
      for (; next < entry.first; ++next)
      {
        out.insert(out.end(), config_.chunk_size, 0x00);
      }
    }
    out.insert(out.end(), entry.second.begin(), entry.second.end());
    next = static_cast<size_t>(entry.first) + 1;
  }

  const bool complete = session_.state == SessionState::COMPLETE && session_.missing().empty();
  return complete ? ErrorCode::OK : ErrorCode::PARTIAL_TRANSFER;
}

}  // namespace file2afsk

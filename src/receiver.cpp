/**
 * @file receiver.cpp
 * @brief Receive loop implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "file2afsk/receiver.hpp"

#include <unistd.h>

#include <fstream>
#include <iterator>

#include "ax25.hpp"

namespace file2afsk
{

bool source_matches(const std::string& filter, const std::string& source)
{
  if (filter.empty())
  {
    return true;
  }

  internal::Callsign wanted;
  if (internal::parse_callsign(filter, wanted) != ErrorCode::OK)
  {
    return false;
  }

  if (filter.find('-') != std::string::npos)
  {
    return internal::format_callsign(wanted) == source;
  }

  return source.substr(0, source.find('-')) == wanted.call;
}

std::string output_filename(const std::string& destination, const std::string& source,
                            std::time_t when)
{
  std::tm utc;
  gmtime_r(&when, &utc);

  char stamp[32];
  if (std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &utc) == 0)
  {
    stamp[0] = '\0';
  }

  const std::string dest = destination.empty() ? "XX" : destination;
  const std::string src = source.empty() ? "UNKNOWN" : source;
  return "received_" + dest + "_from_" + src + "_" + stamp + ".bin";
}

Receiver::Receiver(KissTransport& kiss, ReceiverConfig config, const std::atomic<bool>& cancel)
    : kiss_(kiss),
      config_(std::move(config)),
      cancel_(cancel),
      sessions_(),
      completed_(),
      on_frame_(),
      on_file_(),
      files_(),
      stats_(),
      finished_(false)
{
}

const Session* Receiver::session(const std::string& source, const std::string& destination) const
{
  const auto it = sessions_.find(SessionKey(source, destination));
  return it == sessions_.end() ? nullptr : &it->second.session();
}

ErrorCode Receiver::run()
{
  const ErrorCode rc = receive_loop();

  // Flush and close on every way out of the loop
  const ErrorCode flushed = flush();
  kiss_.close();

  return rc != ErrorCode::OK ? rc : flushed;
}

ErrorCode Receiver::receive_loop()
{
  std::vector<uint8_t> raw;

  while (!cancel_.load())
  {
    const ErrorCode rc = kiss_.next_frame(raw, config_.poll_timeout_ms);
    if (rc == ErrorCode::TIMEOUT)
    {
      continue;
    }
    if (rc != ErrorCode::OK)
    {
      return rc;
    }

    if (handle_frame(raw) == ErrorCode::FILE_ERROR)
    {
      return ErrorCode::FILE_ERROR;
    }

    if (finished_)
    {
      break;
    }
  }

  return ErrorCode::OK;
}

ErrorCode Receiver::handle_frame(const std::vector<uint8_t>& raw)
{
  ++stats_.frames;

  Frame frame;
  if (decode_frame(raw.data(), raw.size(), frame) != ErrorCode::OK)
  {
    ++stats_.malformed;
    notify(FrameStatus::MALFORMED, frame);
    return ErrorCode::MALFORMED_FRAME;
  }

  if (!source_matches(config_.source_filter, frame.source))
  {
    ++stats_.filtered;
    notify(FrameStatus::FILTERED, frame);
    return ErrorCode::OK;
  }

  const SessionKey key(frame.source, frame.destination);

  // A written transfer is only reopened by a fresh start at sequence 0
  const auto done = completed_.find(key);
  if (done != completed_.end())
  {
    if (frame.seq != 0)
    {
      ++stats_.ignored;
      notify(FrameStatus::IGNORED, frame);
      return ErrorCode::OK;
    }
    completed_.erase(done);
  }

  auto it = sessions_.find(key);
  if (it == sessions_.end())
  {
    it = sessions_.emplace(key, Reassembler(ReassemblerConfig{config_.gap_policy, config_.chunk_size}))
             .first;
  }

  switch (it->second.accept(frame))
  {
    case Reassembler::Result::STORED:
      notify(FrameStatus::STORED, frame);
      break;

    case Reassembler::Result::DUPLICATE:
      notify(FrameStatus::DUPLICATE, frame);
      break;

    case Reassembler::Result::COMPLETED:
    {
      notify(FrameStatus::COMPLETED, frame);

      const ErrorCode rc = write_session(it);
      if (rc != ErrorCode::OK)
      {
        return rc;
      }

      if (config_.continuous)
      {
        completed_.insert(key);
      }
      else
      {
        finished_ = true;
      }
      break;
    }
  }

  return ErrorCode::OK;
}

ErrorCode Receiver::flush()
{
  ErrorCode rc = ErrorCode::OK;

  auto it = sessions_.begin();
  while (it != sessions_.end())
  {
    auto next = std::next(it);
    if (write_session(it) != ErrorCode::OK)
    {
      rc = ErrorCode::FILE_ERROR;
    }
    it = next;
  }

  return rc;
}

ErrorCode Receiver::write_session(SessionMap::iterator it)
{
  const Reassembler& reassembler = it->second;
  const Session& session = reassembler.session();

  std::vector<uint8_t> data;
  const ErrorCode assembled = reassembler.assemble(data);

  ReceivedFile file;
  file.path = next_output_path(session);
  file.source = session.source;
  file.destination = session.destination;
  file.bytes = data.size();
  file.chunks = session.chunks.size();
  file.missing = session.missing().size();
  file.complete = (assembled == ErrorCode::OK);

  std::ofstream out(file.path, std::ios::binary | std::ios::trunc);
  if (!out)
  {
    return ErrorCode::FILE_ERROR;
  }
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out)
  {
    return ErrorCode::FILE_ERROR;
  }

  // Only a written transfer leaves the buffer
  sessions_.erase(it);

  files_.push_back(file);
  if (on_file_)
  {
    on_file_(files_.back());
  }

  return ErrorCode::OK;
}

std::string Receiver::next_output_path(const Session& session) const
{
  const std::string dir = config_.output_dir.empty() ? "." : config_.output_dir;
  const std::string name = output_filename(session.destination, session.source, std::time(nullptr));
  const std::string stem = dir + "/" + name.substr(0, name.size() - 4);

  std::string path = stem + ".bin";
  for (int n = 1; access(path.c_str(), F_OK) == 0; ++n)
  {
    path = stem + "-" + std::to_string(n) + ".bin";
  }
  return path;
}

void Receiver::notify(FrameStatus status, const Frame& frame)
{
  if (on_frame_)
  {
    on_frame_(status, frame);
  }
}

}  // namespace file2afsk

/**
 * @file rx_main.cpp
 * @brief file2afsk-rx: receive files from a KISS TNC
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <signal.h>

#include <boost/program_options.hpp>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "file2afsk/kiss_transport.hpp"
#include "file2afsk/protocol.hpp"
#include "file2afsk/receiver.hpp"
#include "file2afsk/transport.hpp"

using namespace file2afsk;

namespace
{

const char VERSION[] = "0.3.0";

std::atomic<bool> g_stop(false);

void on_signal(int)
{
  g_stop.store(true);
}

struct Config
{
  std::string source_filter;
  std::string host;
  uint16_t port = DEFAULT_KISS_PORT;
  std::string serial;
  uint32_t baud = 9600;
  std::string output_dir;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
  bool zero_fill = false;
  bool continuous = false;
  bool verbose = false;
  bool quiet = false;

  static std::optional<Config> parse(int argc, char* argv[])
  {
    namespace po = boost::program_options;

    Config result;

    po::options_description desc("Program options");
    desc.add_options()
        ("help,h", "Print this help message and exit.")
        ("version,V", "Print the application version and exit.")
        ("call,c", po::value<std::string>(&result.source_filter),
            "only accept frames from this callsign (CALL matches any SSID).")
        ("host", po::value<std::string>(&result.host)->default_value(DEFAULT_KISS_HOST),
            "KISS TCP host.")
        ("port", po::value<uint16_t>(&result.port)->default_value(DEFAULT_KISS_PORT),
            "KISS TCP port.")
        ("serial", po::value<std::string>(&result.serial),
            "serial KISS device, used instead of TCP.")
        ("baud", po::value<uint32_t>(&result.baud)->default_value(9600),
            "serial baud rate.")
        ("dir", po::value<std::string>(&result.output_dir)->default_value("."),
            "directory for received files.")
        ("max,m", po::value<size_t>(&result.chunk_size)->default_value(DEFAULT_CHUNK_SIZE),
            "data bytes per frame used by the transmitter (for --zero-fill).")
        ("zero-fill", po::bool_switch(&result.zero_fill),
            "replace lost frames with zero bytes instead of skipping them.")
        ("continuous", po::bool_switch(&result.continuous),
            "keep receiving after a file completes.")
        ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
        ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
        ;

    po::variables_map vm;
    try
    {
      po::store(po::parse_command_line(argc, argv, desc), vm);
    }
    catch (std::exception& ex)
    {
      std::cerr << ex.what() << std::endl;
      std::cout << desc << std::endl;
      return std::nullopt;
    }

    if (vm.count("help"))
    {
      std::cout << "Receive files over 1200 baud AFSK through a KISS TNC.\n"
                << "Files are saved as received_<FILE_ID>_from_<CALL>_<TIME>.bin\n"
                << desc << std::endl;
      return std::nullopt;
    }

    if (vm.count("version"))
    {
      std::cout << argv[0] << ": " << VERSION << std::endl;
      return std::nullopt;
    }

    try
    {
      po::notify(vm);
    }
    catch (std::exception& ex)
    {
      std::cerr << ex.what() << std::endl;
      std::cout << desc << std::endl;
      return std::nullopt;
    }

    if (result.chunk_size < MIN_CHUNK_SIZE || result.chunk_size > MAX_CHUNK_SIZE)
    {
      std::cerr << "Error: --max should be between " << MIN_CHUNK_SIZE << " and "
                << MAX_CHUNK_SIZE << std::endl;
      return std::nullopt;
    }

    if (result.quiet && result.verbose)
    {
      std::cerr << "Error: --quiet and --verbose are mutually exclusive" << std::endl;
      return std::nullopt;
    }

    return result;
  }
};

// No SA_RESTART: a blocking poll() must return so the loop sees the flag
void install_signal_handlers()
{
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

const char* status_text(FrameStatus status)
{
  switch (status)
  {
    case FrameStatus::STORED:
      return "stored";
    case FrameStatus::DUPLICATE:
      return "duplicate";
    case FrameStatus::COMPLETED:
      return "stored (last)";
    case FrameStatus::MALFORMED:
      return "malformed, skipped";
    case FrameStatus::FILTERED:
      return "other station, skipped";
    case FrameStatus::IGNORED:
      return "late repeat, skipped";
  }
  return "";
}

}  // namespace

int main(int argc, char* argv[])
{
  const std::optional<Config> parsed = Config::parse(argc, argv);
  if (!parsed)
  {
    return 1;
  }
  const Config& config = *parsed;

  ReceiverConfig rx_config;
  rx_config.source_filter = config.source_filter;
  rx_config.output_dir = config.output_dir;
  rx_config.gap_policy = config.zero_fill ? GapPolicy::ZERO_FILL : GapPolicy::SKIP;
  rx_config.chunk_size = config.chunk_size;
  rx_config.continuous = config.continuous;

  const std::string target =
      config.serial.empty() ? config.host + ":" + std::to_string(config.port) : config.serial;

  if (!config.quiet)
  {
    std::cout << "Receiver starting...\n"
              << "KISS target       : " << target << "\n"
              << "Output directory  : " << config.output_dir << "\n"
              << "Lost frames       : "
              << (config.zero_fill ? "zero-filled (" + std::to_string(config.chunk_size) + " bytes)"
                                   : std::string("skipped"))
              << "\n";
    if (!config.source_filter.empty())
    {
      std::cout << "Accepting         : " << config.source_filter << "\n";
    }
    std::cout << "Checking KISS connection... " << std::flush;
  }

  std::unique_ptr<Transport> transport;
  const ErrorCode opened =
      config.serial.empty()
          ? open_tcp(config.host, config.port, DEFAULT_CONNECT_TIMEOUT_MS, transport)
          : open_serial(config.serial, config.baud, transport);
  if (opened != ErrorCode::OK)
  {
    std::cerr << "\nError: " << error_message(opened) << " (" << target << ")" << std::endl;
    std::cerr << "   -> Is the TNC running with its KISS port enabled?" << std::endl;
    return 1;
  }
  if (!config.quiet)
  {
    std::cout << "OK\n\nWaiting for transmissions (Ctrl-C to stop)..." << std::endl;
  }

  install_signal_handlers();

  KissTransport kiss(*transport);
  Receiver receiver(kiss, rx_config, g_stop);

  if (!config.quiet)
  {
    receiver.set_frame_callback(
        [&config](FrameStatus status, const Frame& frame)
        {
          if (status == FrameStatus::MALFORMED || status == FrameStatus::FILTERED ||
              status == FrameStatus::IGNORED)
          {
            if (config.verbose)
            {
              std::cout << "   ! frame " << status_text(status) << std::endl;
            }
            return;
          }
          std::cout << "   Frame " << std::setw(4) << frame.seq << " from " << frame.source
                    << " [" << frame.destination << "] " << frame.payload.size() << " bytes "
                    << status_text(status) << std::endl;
        });
  }

  receiver.set_file_callback(
      [&config](const ReceivedFile& file)
      {
        if (config.quiet)
        {
          return;
        }
        std::cout << "\n=== " << (file.complete ? "File received" : "Partial file saved")
                  << " ===\n"
                  << "   FILE_ID : " << file.destination << "\n"
                  << "   From    : " << file.source << "\n"
                  << "   Saved   : " << file.path << " (" << file.bytes << " bytes, "
                  << file.chunks << " frames";
        if (file.missing > 0)
        {
          std::cout << ", " << file.missing << " missing";
        }
        std::cout << ")\n" << std::endl;
      });

  const ErrorCode rc = receiver.run();

  if (!config.quiet)
  {
    if (g_stop.load())
    {
      std::cout << "\nReceiver stopped by user." << std::endl;
    }
    const ReceiverStats& stats = receiver.stats();
    std::cout << "Frames: " << stats.frames << " received, " << stats.malformed << " malformed, "
              << stats.filtered << " filtered, " << kiss.dropped_frames()
              << " dropped by KISS decoder" << std::endl;
  }

  switch (rc)
  {
    case ErrorCode::OK:
      return 0;

    case ErrorCode::TRANSPORT_CLOSED:
      std::cerr << "Warning: connection closed by the TNC." << std::endl;
      return 0;

    default:
      std::cerr << "Error: " << error_message(rc) << std::endl;
      return 1;
  }
}

/**
 * @file tx_main.cpp
 * @brief file2afsk-tx: send a file through a KISS TNC
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file2afsk/kiss_transport.hpp"
#include "file2afsk/protocol.hpp"
#include "file2afsk/transmitter.hpp"
#include "file2afsk/transport.hpp"

using namespace file2afsk;

namespace
{

const char VERSION[] = "0.3.0";

struct Config
{
  std::string filename;
  std::string source;
  std::string file_id;
  std::string host;
  uint16_t port = DEFAULT_KISS_PORT;
  std::string serial;
  uint32_t baud = 9600;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
  double delay = 1.0;
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
        ("file", po::value<std::string>(&result.filename)->required(),
            "binary file to transmit.")
        ("call,c", po::value<std::string>(&result.source)->default_value("N0CALL"),
            "source callsign, optionally with SSID (CALL-N).")
        ("file-id", po::value<std::string>(&result.file_id),
            "destination address (default: derived from the file name).")
        ("host", po::value<std::string>(&result.host)->default_value(DEFAULT_KISS_HOST),
            "KISS TCP host.")
        ("port", po::value<uint16_t>(&result.port)->default_value(DEFAULT_KISS_PORT),
            "KISS TCP port.")
        ("serial", po::value<std::string>(&result.serial),
            "serial KISS device, used instead of TCP.")
        ("baud", po::value<uint32_t>(&result.baud)->default_value(9600),
            "serial baud rate.")
        ("max,m", po::value<size_t>(&result.chunk_size)->default_value(DEFAULT_CHUNK_SIZE),
            "data bytes per frame (16-253, 100-150 for noisy channels).")
        ("delay,d", po::value<double>(&result.delay)->default_value(1.0),
            "seconds between frames (1-5 for noisy links, 0.1 for strong links).")
        ("verbose,v", po::bool_switch(&result.verbose), "verbose output")
        ("quiet,q", po::bool_switch(&result.quiet), "silence all output")
        ;

    po::positional_options_description positional;
    positional.add("file", 1);

    po::variables_map vm;
    try
    {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
    }
    catch (std::exception& ex)
    {
      std::cerr << ex.what() << std::endl;
      std::cout << desc << std::endl;
      return std::nullopt;
    }

    if (vm.count("help"))
    {
      std::cout << "Transmit a binary file over 1200 baud AFSK through a KISS TNC.\n"
                << "Usage: " << argv[0] << " FILE [options]\n"
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

    if (result.delay < 0)
    {
      std::cerr << "Error: --delay cannot be negative" << std::endl;
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

std::string basename_of(const std::string& path)
{
  const size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
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

  std::vector<uint8_t> data;
  if (read_file(config.filename, data) != ErrorCode::OK)
  {
    std::cerr << "Error: cannot read file '" << config.filename << "'" << std::endl;
    return 1;
  }

  TransmitterConfig tx_config;
  tx_config.source = config.source;
  tx_config.destination = config.file_id.empty() ? file_id_for(config.filename) : config.file_id;
  tx_config.chunk_size = config.chunk_size;
  tx_config.frame_delay =
      std::chrono::milliseconds(static_cast<int64_t>(config.delay * 1000.0 + 0.5));

  const std::string target =
      config.serial.empty() ? config.host + ":" + std::to_string(config.port) : config.serial;

  if (!config.quiet)
  {
    std::cout << "Transmitting file : " << basename_of(config.filename) << "\n"
              << "FILE_ID           : " << tx_config.destination << "\n"
              << "Source            : " << tx_config.source << "\n"
              << "MAX_INFO          : " << tx_config.chunk_size << " bytes/frame\n"
              << "Frame delay       : " << config.delay << " seconds\n"
              << "KISS target       : " << target << "\n"
              << std::endl;
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
    std::cout << "OK" << std::endl;
  }

  KissTransport kiss(*transport);
  Transmitter transmitter(kiss, tx_config);

  if (!config.quiet)
  {
    transmitter.set_progress(
        [&config](const Chunk& chunk, size_t total)
        {
          std::cout << "Frame " << std::setw(4) << chunk.seq << "/" << (total - 1) << " -> "
                    << std::setw(3) << chunk.payload.size() << " bytes";
          if (config.verbose && chunk.is_last)
          {
            std::cout << " (last)";
          }
          std::cout << std::endl;
        });

    std::cout << "Sending " << data.size() << " bytes..." << std::endl;
  }

  const ErrorCode rc = transmitter.transmit(data, tx_config.destination);
  kiss.close();

  if (rc != ErrorCode::OK)
  {
    std::cerr << "\nError: " << error_message(rc) << " after " << transmitter.frames_sent()
              << " frames" << std::endl;
    return 1;
  }

  if (!config.quiet)
  {
    std::cout << "\nDone: " << transmitter.frames_sent() << " frames sent." << std::endl;
  }

  return 0;
}

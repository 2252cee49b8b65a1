#include "rawx/config/options.hpp"
#include "rawx/chunk/chunk_id.hpp"
#include <iostream>
#include <unordered_map>

namespace rawx {
namespace config {

namespace {

enum class Flag {
  HOST,
  PORT,
  DOCROOT,
  NAMESPACE,
  SERVICE_ID,
  COMPRESS,
  HASH_WIDTH,
  HASH_DEPTH,
  FSYNC,
  BEANSTALKD,
  TUBE,
  LOG_FILE,
  LOG_LEVEL
};

// Flags that stand alone, every other one takes a value
bool is_switch(Flag flag) {
  return flag == Flag::COMPRESS || flag == Flag::FSYNC;
}

bool parse_number(const std::string& value, unsigned long max, unsigned long& out) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    out = std::stoul(value);
  } catch (const std::out_of_range&) {
    return false;
  }
  return out <= max;
}

} // namespace

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -p <port> -d <docroot> [options]\n"
        << "Required arguments:\n"
        << "  -p, --port          Port number\n"
        << "  -d, --docroot       Directory holding the chunks\n"
        << "Options:\n"
        << "  -h, --host          Listening address (default 127.0.0.1)\n"
        << "  -n, --namespace     Namespace name\n"
        << "  -i, --service-id    Service identifier attached to events\n"
        << "  --compress          Compress chunks with zlib on upload\n"
        << "  --hash-width        Characters per directory level (default 3)\n"
        << "  --hash-depth        Directory levels (default 1)\n"
        << "  --fsync             Flush chunk data to disk before commit\n"
        << "  --beanstalkd        host:port of the event queue\n"
        << "  --tube              Tube receiving the events (default oio)\n"
        << "  --log-file          Also log to this file, rotated every 10 MB\n"
        << "  --log-level         trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 6200 -d /var/lib/rawx -n OPENIO\n";
}

bool parse_host_port(const std::string& value, std::string& host, uint16_t& port) {
  auto colon = value.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  unsigned long number = 0;
  if (!parse_number(value.substr(colon + 1), 65535, number) || number == 0) {
    return false;
  }
  host = value.substr(0, colon);
  port = static_cast<uint16_t>(number);
  return true;
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-h", Flag::HOST},
    {"--host", Flag::HOST},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"-d", Flag::DOCROOT},
    {"--docroot", Flag::DOCROOT},
    {"-n", Flag::NAMESPACE},
    {"--namespace", Flag::NAMESPACE},
    {"-i", Flag::SERVICE_ID},
    {"--service-id", Flag::SERVICE_ID},
    {"--compress", Flag::COMPRESS},
    {"--hash-width", Flag::HASH_WIDTH},
    {"--hash-depth", Flag::HASH_DEPTH},
    {"--fsync", Flag::FSYNC},
    {"--beanstalkd", Flag::BEANSTALKD},
    {"--tube", Flag::TUBE},
    {"--log-file", Flag::LOG_FILE},
    {"--log-level", Flag::LOG_LEVEL}
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "rawx";

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    auto it = flag_map.find(arg);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(program_name);
      return options;
    }
    const Flag flag = it->second;

    if (is_switch(flag)) {
      if (flag == Flag::COMPRESS) {
        options.compress = true;
      } else {
        options.fsync = true;
      }
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << arg << '\n';
      print_usage(program_name);
      return options;
    }
    const std::string value(argv[++i]);
    unsigned long number = 0;

    switch (flag) {
      case Flag::HOST:
        options.host = value;
        break;
      case Flag::PORT:
        if (!parse_number(value, 65535, number) || number == 0) {
          std::cerr << "Error: Invalid port number\n";
          print_usage(program_name);
          return options;
        }
        options.port = static_cast<uint16_t>(number);
        break;
      case Flag::DOCROOT:
        options.docroot = value;
        break;
      case Flag::NAMESPACE:
        options.ns = value;
        break;
      case Flag::SERVICE_ID:
        options.service_id = value;
        break;
      case Flag::HASH_WIDTH:
      case Flag::HASH_DEPTH:
        if (!parse_number(value, 16, number)) {
          std::cerr << "Error: Invalid value for " << arg << '\n';
          print_usage(program_name);
          return options;
        }
        (flag == Flag::HASH_WIDTH ? options.hash_width : options.hash_depth) = number;
        break;
      case Flag::BEANSTALKD:
        if (!parse_host_port(value, options.beanstalkd_host, options.beanstalkd_port)) {
          std::cerr << "Error: Expected host:port for " << arg << '\n';
          print_usage(program_name);
          return options;
        }
        break;
      case Flag::TUBE:
        options.beanstalkd_tube = value;
        break;
      case Flag::LOG_FILE:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        if (!logger::parse_severity(value, options.log_level)) {
          std::cerr << "Error: Unknown log level: " << value << '\n';
          print_usage(program_name);
          return options;
        }
        break;
      default:
        break;
    }
  }

  if (options.port == 0 || options.docroot.empty()) {
    std::cerr << "Error: Both port and docroot are required\n";
    print_usage(program_name);
    return options;
  }
  if (options.hash_depth > 0 && options.hash_width == 0) {
    std::cerr << "Error: Hash width must be positive when hash depth is\n";
    print_usage(program_name);
    return options;
  }
  if (options.hash_width * options.hash_depth >= chunk::ChunkId::LENGTH) {
    std::cerr << "Error: Hash width times depth must stay below the chunk ID length\n";
    print_usage(program_name);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace rawx

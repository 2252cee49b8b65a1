#ifndef RAWX_CONFIG_OPTIONS_HPP
#define RAWX_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <string>
#include "rawx/logger/logger.hpp"

namespace rawx {
namespace config {

struct ProgramOptions {
  // Listening address
  std::string host{"127.0.0.1"};
  uint16_t port{0};

  // Storage
  std::string docroot;
  std::size_t hash_width{3};
  std::size_t hash_depth{1};
  bool fsync{false};
  bool compress{false};

  // Identity
  std::string ns;
  std::string service_id;

  // Event queue, disabled when the host is empty
  std::string beanstalkd_host;
  uint16_t beanstalkd_port{11300};
  std::string beanstalkd_tube{"oio"};

  // Logging
  std::string log_file;
  logger::severity_level log_level{logger::severity_level::info};

  bool valid{false};

  // "host:port" this service answers on, checked against COPY destinations
  std::string service_url() const { return host + ":" + std::to_string(port); }
};

void print_usage(const std::string& program_name);

// Reads the flags of the command line. Reports the first problem on stderr
// and returns options with valid unset.
ProgramOptions parse_command_line(int argc, const char* const argv[]);

// Splits "host:port", false when the port is missing or out of range
bool parse_host_port(const std::string& value, std::string& host, uint16_t& port);

} // namespace config
} // namespace rawx

#endif // RAWX_CONFIG_OPTIONS_HPP

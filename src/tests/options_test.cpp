#include <gtest/gtest.h>
#include <vector>
#include "rawx/config/options.hpp"

using namespace rawx::config;

namespace {

ProgramOptions parse(std::vector<const char*> args) {
  args.insert(args.begin(), "rawx");
  return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(OptionsTest, MinimalCommandLine) {
  auto options = parse({"-p", "6200", "-d", "/var/lib/rawx"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.host, "127.0.0.1");
  EXPECT_EQ(options.port, 6200);
  EXPECT_EQ(options.docroot, "/var/lib/rawx");
  EXPECT_EQ(options.hash_width, 3u);
  EXPECT_EQ(options.hash_depth, 1u);
  EXPECT_FALSE(options.compress);
  EXPECT_FALSE(options.fsync);
  EXPECT_TRUE(options.beanstalkd_host.empty());
  EXPECT_EQ(options.log_level, rawx::logger::severity_level::info);
  EXPECT_EQ(options.service_url(), "127.0.0.1:6200");
}

TEST(OptionsTest, FullCommandLine) {
  auto options = parse({"--host", "0.0.0.0", "--port", "6201", "--docroot", "/srv/rawx",
                        "-n", "OPENIO", "-i", "rawx-1", "--compress", "--fsync",
                        "--hash-width", "2", "--hash-depth", "2",
                        "--beanstalkd", "10.0.0.5:11300", "--tube", "events",
                        "--log-file", "/var/log/rawx.log", "--log-level", "debug"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.host, "0.0.0.0");
  EXPECT_EQ(options.port, 6201);
  EXPECT_EQ(options.ns, "OPENIO");
  EXPECT_EQ(options.service_id, "rawx-1");
  EXPECT_TRUE(options.compress);
  EXPECT_TRUE(options.fsync);
  EXPECT_EQ(options.hash_width, 2u);
  EXPECT_EQ(options.hash_depth, 2u);
  EXPECT_EQ(options.beanstalkd_host, "10.0.0.5");
  EXPECT_EQ(options.beanstalkd_port, 11300);
  EXPECT_EQ(options.beanstalkd_tube, "events");
  EXPECT_EQ(options.log_file, "/var/log/rawx.log");
  EXPECT_EQ(options.log_level, rawx::logger::severity_level::debug);
}

TEST(OptionsTest, RejectsBadCommandLines) {
  EXPECT_FALSE(parse({}).valid);
  EXPECT_FALSE(parse({"-p", "6200"}).valid);
  EXPECT_FALSE(parse({"-d", "/srv"}).valid);
  EXPECT_FALSE(parse({"-p", "70000", "-d", "/srv"}).valid);
  EXPECT_FALSE(parse({"-p", "abc", "-d", "/srv"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d", "/srv", "--bogus", "1"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d", "/srv", "--beanstalkd", "nohost"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d", "/srv", "--log-level", "loud"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d", "/srv", "--hash-width", "0"}).valid);
  EXPECT_FALSE(parse({"-p", "6200", "-d", "/srv", "--hash-width", "16", "--hash-depth", "4"}).valid);
}

TEST(OptionsTest, HostPortSplitting) {
  std::string host;
  uint16_t port = 0;
  EXPECT_TRUE(parse_host_port("localhost:11300", host, port));
  EXPECT_EQ(host, "localhost");
  EXPECT_EQ(port, 11300);
  EXPECT_FALSE(parse_host_port(":11300", host, port));
  EXPECT_FALSE(parse_host_port("localhost:", host, port));
  EXPECT_FALSE(parse_host_port("localhost:0", host, port));
}

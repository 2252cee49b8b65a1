#include "rawx/chunk/chunk_handler.hpp"
#include "rawx/config/options.hpp"
#include "rawx/http/http_server.hpp"
#include "rawx/logger/logger.hpp"
#include "rawx/notify/beanstalk_notifier.hpp"
#include "rawx/stats/service_stats.hpp"
#include "rawx/store/file_repository.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>
#include <memory>

std::unique_ptr<rawx::notify::Notifier> make_notifier(const rawx::config::ProgramOptions& options) {
  if (options.beanstalkd_host.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Main: No beanstalkd configured, events are dropped";
    return std::make_unique<rawx::notify::NullNotifier>();
  }
  return std::make_unique<rawx::notify::BeanstalkNotifier>(
    options.beanstalkd_host, options.beanstalkd_port, options.beanstalkd_tube);
}

// Blocks until SIGINT or SIGTERM
void wait_for_termination() {
  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number;
    }
  });
  signals_context.run();
}

bool run_rawx(const rawx::config::ProgramOptions& options) {
  try {
    rawx::store::FileRepository repository(options.docroot, options.hash_width,
                                           options.hash_depth, options.fsync);
    auto notifier = make_notifier(options);
    rawx::stats::ServiceStats stats;
    rawx::logger::RequestLogger request_logger;

    rawx::chunk::ServerSettings settings;
    settings.compress = options.compress;
    settings.service_url = options.service_url();
    settings.notify_context.ns = options.ns;
    settings.notify_context.service_id =
      options.service_id.empty() ? options.service_url() : options.service_id;

    rawx::chunk::ChunkHandler handler(
      rawx::chunk::Services{repository, *notifier, stats, request_logger, settings});
    rawx::http::HttpServer server(options.host, options.port, handler, stats,
                                  rawx::http::ServiceInfo{options.ns, options.docroot});

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start the HTTP server\n";
      return false;
    }

    wait_for_termination();
    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start rawx: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = rawx::config::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  rawx::logger::init_logging(options.log_file, options.log_level);

  if (!run_rawx(options)) {
    return 1;
  }
  return 0;
}

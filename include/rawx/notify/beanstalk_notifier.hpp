#ifndef RAWX_NOTIFY_BEANSTALK_NOTIFIER_HPP
#define RAWX_NOTIFY_BEANSTALK_NOTIFIER_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "rawx/notify/notifier.hpp"

namespace rawx {
namespace notify {

// Publishes events as jobs in a beanstalkd tube. One connection is shared by
// all request threads and reopened after any failure. Every exchange with
// beanstalkd is bounded by a timeout so a stalled queue cannot hold uploads.
class BeanstalkNotifier : public Notifier {
public:

  static constexpr unsigned PRIORITY = 1024;
  static constexpr unsigned TTR = 120;
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeanstalkNotifier(const std::string& host, uint16_t port, const std::string& tube = "oio",
                    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
  ~BeanstalkNotifier() override;


  // ---- EVENT PUBLICATION ----
  void notify_new(const std::string& event, const chunk::ChunkMetadata& meta,
                  const NotifyContext& context) override;

private:
  // ---- PARAMETERS ----
  const std::string host_;
  const uint16_t port_;
  const std::string tube_;
  const std::chrono::milliseconds timeout_;

  std::mutex mutex_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  boost::asio::streambuf reply_buffer_;


  // ---- CONNECTION MANAGEMENT ----
  // Connects and selects the tube, unless already connected
  void ensure_connected();
  void disconnect();


  // ---- PROTOCOL ----
  // Sends one command, returns the reply line without its CRLF
  std::string request(const std::string& command);
  std::string read_line();

  // Runs the pending operation until it completes or the timeout expires
  void wait_for(const boost::system::error_code& ec, const char* what);
};

} // namespace notify
} // namespace rawx

#endif // RAWX_NOTIFY_BEANSTALK_NOTIFIER_HPP

#include "rawx/notify/beanstalk_notifier.hpp"
#include <chrono>
#include <istream>
#include <boost/log/trivial.hpp>

namespace rawx {
namespace notify {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeanstalkNotifier::BeanstalkNotifier(const std::string& host, uint16_t port, const std::string& tube,
                                     std::chrono::milliseconds timeout)
  : host_(host)
  , port_(port)
  , tube_(tube)
  , timeout_(timeout) {
  BOOST_LOG_TRIVIAL(info) << "Beanstalk notifier: Events go to " << host << ":" << port
                          << " tube " << tube;
}

BeanstalkNotifier::~BeanstalkNotifier() {
  disconnect();
}


//==============================================
// EVENT PUBLICATION
//==============================================

void BeanstalkNotifier::notify_new(const std::string& event, const chunk::ChunkMetadata& meta,
                                   const NotifyContext& context) {
  auto now = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  std::string payload = make_event(event, meta, context, now);

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    ensure_connected();

    std::string reply = request("put " + std::to_string(PRIORITY) + " 0 " + std::to_string(TTR)
                                + " " + std::to_string(payload.size()) + "\r\n" + payload);
    if (reply.rfind("INSERTED", 0) != 0) {
      throw NotifyError("beanstalkd refused the job: " + reply);
    }
    BOOST_LOG_TRIVIAL(debug) << "Beanstalk notifier: Job " << reply << " for chunk " << meta.chunk_id;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Beanstalk notifier: Connection error: " << e.what();
    disconnect();
    throw NotifyError(e.what());
  }
  catch (const NotifyError&) {
    disconnect();
    throw;
  }
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

void BeanstalkNotifier::ensure_connected() {
  if (socket_ && socket_->is_open()) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Beanstalk notifier: Connecting to " << host_ << ":" << port_;

  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_));

  boost::system::error_code ec;
  socket_ = std::make_unique<boost::asio::ip::tcp::socket>(io_context_);
  boost::asio::async_connect(*socket_, endpoints,
    [&](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
      ec = error;
    });
  wait_for(ec, "connect");
  reply_buffer_.consume(reply_buffer_.size());

  std::string reply = request("use " + tube_);
  if (reply != "USING " + tube_) {
    throw NotifyError("failed to use tube " + tube_ + ": " + reply);
  }
}

void BeanstalkNotifier::disconnect() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Beanstalk notifier: Error closing socket: " << ec.message();
    }
  }
  socket_.reset();
}


//==============================================
// PROTOCOL
//==============================================

std::string BeanstalkNotifier::request(const std::string& command) {
  std::string line = command + "\r\n";
  boost::system::error_code ec;
  boost::asio::async_write(*socket_, boost::asio::buffer(line),
    [&](const boost::system::error_code& error, std::size_t) { ec = error; });
  wait_for(ec, "write");
  return read_line();
}

std::string BeanstalkNotifier::read_line() {
  boost::system::error_code ec;
  boost::asio::async_read_until(*socket_, reply_buffer_, "\r\n",
    [&](const boost::system::error_code& error, std::size_t) { ec = error; });
  wait_for(ec, "read");

  std::istream input(&reply_buffer_);
  std::string line;
  std::getline(input, line);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

void BeanstalkNotifier::wait_for(const boost::system::error_code& ec, const char* what) {
  io_context_.restart();
  io_context_.run_for(timeout_);
  if (!io_context_.stopped()) {
    // Cancel the operation and let its handler run before the locals it captured go away
    if (socket_) {
      boost::system::error_code ignored;
      socket_->close(ignored);
    }
    io_context_.run();
    throw NotifyError(std::string("beanstalkd ") + what + " timed out after "
                      + std::to_string(timeout_.count()) + "ms");
  }
  if (ec) {
    throw boost::system::system_error(ec, std::string("beanstalkd ") + what);
  }
}

} // namespace notify
} // namespace rawx

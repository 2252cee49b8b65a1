#ifndef RAWX_HTTP_SERVER_HPP
#define RAWX_HTTP_SERVER_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "rawx/chunk/chunk_handler.hpp"
#include "rawx/http/message.hpp"
#include "rawx/stats/service_stats.hpp"

namespace rawx {
namespace http {

// Identity reported on GET /info
struct ServiceInfo {
  std::string ns;
  std::string docroot;
};

// Sends status line and headers, then streams the reply body in blocks.
// Returns false when the connection can no longer be used.
bool write_reply(boost::asio::ip::tcp::socket& socket, Reply& reply, unsigned version,
                 bool head_request, bool keep_alive, std::uint64_t& bytes_out);

class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, uint16_t port, chunk::ChunkHandler& handler,
             const stats::ServiceStats& stats, ServiceInfo info);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Port actually bound, useful when constructed with port 0
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }

private:
  struct Session {
    std::shared_ptr<boost::asio::ip::tcp::socket> socket;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // One thread per connection
  std::mutex sessions_mutex_;
  std::list<Session> sessions_;

  // System components
  chunk::ChunkHandler& handler_;
  const stats::ServiceStats& stats_;
  const ServiceInfo info_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that hands every connection to its own thread
  void start_accept();
  // Joins the threads of the connections that are over
  void reap_sessions();
  // Serves the requests of one keep-alive connection, in order
  void serve_connection(boost::asio::ip::tcp::socket& socket);


  // ---- ROUTING ----
  // Service pages first, chunk dispatcher for everything else
  Reply route(Request& request);
};

} // namespace http
} // namespace rawx

#endif // RAWX_HTTP_SERVER_HPP

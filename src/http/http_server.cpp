#include "rawx/http/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <iterator>
#include <limits>
#include <vector>

namespace rawx {
namespace http {

namespace beast_http = boost::beast::http;
using boost::asio::ip::tcp;

namespace {

using Parser = beast_http::request_parser<beast_http::buffer_body>;

// Request body pulled from the connection on demand, one block at a time.
// A client waiting on "Expect: 100-continue" is invited on the first read,
// so a request refused from its headers never gets its body sent.
class SocketRequestBody : public RequestBody {
public:
  SocketRequestBody(tcp::socket& socket, boost::beast::flat_buffer& buffer, Parser& parser,
                    bool expect_continue)
    : socket_(socket)
    , buffer_(buffer)
    , parser_(parser)
    , header_count_(std::distance(parser.get().begin(), parser.get().end()))
    , continue_pending_(expect_continue) {
    if (auto length = parser_.content_length()) {
      content_length_ = *length;
    }
  }

  std::size_t read(char* buffer, std::size_t size) override {
    if (continue_pending_) {
      send_continue();
    }
    while (!parser_.is_done()) {
      auto& body = parser_.get().body();
      body.data = buffer;
      body.size = size;

      boost::system::error_code ec;
      beast_http::read(socket_, buffer_, parser_, ec);
      if (ec == beast_http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        throw boost::system::system_error(ec, "Request body read failed");
      }

      std::size_t n = size - body.size;
      bytes_read_ += n;
      if (n > 0) {
        return n;
      }
    }
    collect_trailers();
    return 0;
  }

  std::optional<std::uint64_t> content_length() const override { return content_length_; }

  const HeaderMap& trailers() const override { return trailers_; }

  bool is_done() const { return parser_.is_done(); }

  std::uint64_t bytes_read() const { return bytes_read_; }

private:
  tcp::socket& socket_;
  boost::beast::flat_buffer& buffer_;
  Parser& parser_;
  std::ptrdiff_t header_count_;
  bool continue_pending_;
  std::optional<std::uint64_t> content_length_;
  HeaderMap trailers_;
  bool trailers_collected_ = false;
  std::uint64_t bytes_read_ = 0;

  void send_continue() {
    continue_pending_ = false;
    if (parser_.is_done()) {
      return;
    }
    beast_http::response<beast_http::empty_body> proceed{beast_http::status::continue_,
                                                         parser_.get().version()};
    boost::system::error_code ec;
    beast_http::write(socket_, proceed, ec);
    if (ec) {
      throw boost::system::system_error(ec, "Failed to send 100-continue");
    }
  }

  // The parser appends trailer fields after the header fields once the last
  // chunk is read, in arrival order. A trailer repeating a header name wins.
  void collect_trailers() {
    if (trailers_collected_) {
      return;
    }
    trailers_collected_ = true;
    auto it = parser_.get().begin();
    std::advance(it, header_count_);
    for (; it != parser_.get().end(); ++it) {
      trailers_[std::string(it->name_string())] = std::string(it->value());
    }
  }
};

bool iequals(const std::string& a, const std::string& b) {
  return !FieldLess()(a, b) && !FieldLess()(b, a);
}

bool is_service_page(const std::string& target) {
  return target == "/stat" || target == "/info";
}

// Parse failures deserve a 400; transport failures leave nobody to answer
bool is_malformed_request(const boost::system::error_code& ec) {
  return ec.category() == beast_http::make_error_code(beast_http::error::bad_method).category()
    && ec != beast_http::error::partial_message;
}

} // namespace

//==============================================
// REPLY SERIALIZATION
//==============================================

bool write_reply(tcp::socket& socket, Reply& reply, unsigned version, bool head_request,
                 bool keep_alive, std::uint64_t& bytes_out) {
  beast_http::response<beast_http::buffer_body> res{
    static_cast<beast_http::status>(reply.status), version};
  res.set(beast_http::field::server, "rawx");
  for (const auto& [name, value] : reply.headers) {
    res.set(name, value);
  }
  res.keep_alive(keep_alive);

  const bool bodiless_status = reply.status < 200 || reply.status == 204 || reply.status == 304;
  const bool has_body = reply.body && !head_request && !bodiless_status;

  std::optional<std::uint64_t> declared;
  if (auto it = reply.headers.find("Content-Length"); it != reply.headers.end()) {
    declared = std::stoull(it->second);
  } else if (has_body) {
    res.chunked(true);
  } else if (!bodiless_status) {
    res.content_length(0);
  }

  res.body().data = nullptr;
  res.body().more = has_body;

  boost::system::error_code ec;
  beast_http::response_serializer<beast_http::buffer_body> sr{res};
  beast_http::write_header(socket, sr, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to write reply headers: " << ec.message();
    return false;
  }

  std::uint64_t sent = 0;
  if (has_body) {
    std::vector<char> block(io::BLOCK_SIZE);
    for (;;) {
      std::size_t n = 0;
      try {
        n = reply.body->read(block.data(), block.size());
      } catch (const std::exception& e) {
        // Headers are gone already, only closing the connection tells the client
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Reply body read failed after "
                                 << sent << " bytes: " << e.what();
        return false;
      }
      if (n == 0) {
        break;
      }

      res.body().data = block.data();
      res.body().size = n;
      res.body().more = true;
      beast_http::write(socket, sr, ec);
      if (ec == beast_http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Reply body write failed after "
                                 << sent << " bytes: " << ec.message();
        bytes_out += sent;
        return false;
      }
      sent += n;
    }
  }
  bytes_out += sent;

  res.body().data = nullptr;
  res.body().size = 0;
  res.body().more = false;
  beast_http::write(socket, sr, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to finish reply: " << ec.message();
    return false;
  }

  if (has_body && declared && sent != *declared) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Reply body delivered " << sent << " of "
                               << *declared << " announced bytes";
    return false;
  }
  return true;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, chunk::ChunkHandler& handler,
                       const stats::ServiceStats& stats, ServiceInfo info)
  : address_(address)
  , port_(port)
  , is_running_(false)
  , handler_(handler)
  , stats_(stats)
  , info_(std::move(info)) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, endpoint);

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    return false;
  }
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  // Unblock the connection threads, then wait for them
  std::list<Session> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.splice(sessions.end(), sessions_);
  }
  for (auto& session : sessions) {
    boost::system::error_code ec;
    session.socket->shutdown(tcp::socket::shutdown_both, ec);
  }
  for (auto& session : sessions) {
    if (session.thread.joinable()) {
      session.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

uint16_t HttpServer::local_port() const {
  if (!acceptor_) {
    return port_;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (error) {
        if (is_running_) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
        }
        start_accept();
        return;
      }

      reap_sessions();
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      sessions_.emplace_back();
      Session& session = sessions_.back();
      session.socket = socket;
      session.thread = std::thread([this, &session]() {
        serve_connection(*session.socket);
        session.done = true;
      });
      start_accept();
    });
}

void HttpServer::reap_sessions() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->done) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

void HttpServer::serve_connection(tcp::socket& socket) {
  boost::system::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Connection from " << remote;

  boost::beast::flat_buffer buffer;
  while (is_running_) {
    Parser parser;
    // No limit on request bodies
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    beast_http::read_header(socket, buffer, parser, ec);
    if (ec == beast_http::error::end_of_stream || ec == boost::asio::error::eof) {
      break;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Header read error from " << remote
                               << ": " << ec.message();
      if (is_malformed_request(ec)) {
        Reply reply = make_reply(400);
        std::uint64_t bytes_out = 0;
        write_reply(socket, reply, 11, false, false, bytes_out);
      }
      break;
    }

    const auto start = std::chrono::steady_clock::now();
    auto& message = parser.get();

    Request request;
    request.method = std::string(message.method_string());
    request.target = std::string(message.target());
    for (const auto& field : message) {
      request.headers[std::string(field.name_string())] = std::string(field.value());
    }

    SocketRequestBody body(socket, buffer, parser,
                           iequals(request.header("Expect"), "100-continue"));
    request.body = &body;

    const unsigned version = message.version();
    const bool head_request = message.method() == beast_http::verb::head;

    Reply reply = route(request);

    // Unread request bytes would be taken for the next request
    const bool keep_alive = message.keep_alive() && body.is_done();

    std::uint64_t bytes_out = 0;
    const bool written = write_reply(socket, reply, version, head_request, keep_alive, bytes_out);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
    const stats::Verb verb = is_service_page(request.target)
      ? stats::Verb::OTHER
      : chunk::ChunkHandler::verb_for(request.method);
    handler_.services().stats.record(verb, reply.status, elapsed, body.bytes_read(), bytes_out);
    BOOST_LOG_TRIVIAL(info) << "HTTP server: " << remote << " " << request.method << " "
                            << request.target << " " << reply.status << " "
                            << elapsed.count() << "us";

    if (!written || !keep_alive) {
      break;
    }
  }

  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Connection from " << remote << " closed";
}


//==============================================
// ROUTING
//==============================================

Reply HttpServer::route(Request& request) {
  if (is_service_page(request.target)) {
    if (request.method != "GET" && request.method != "HEAD") {
      return make_reply(405);
    }
    std::string text = request.target == "/stat"
      ? stats_.render()
      : "namespace " + info_.ns + "\npath " + info_.docroot + "\n";
    Reply reply = make_reply(200);
    reply.set_header("Content-Type", "text/plain");
    reply.set_header("Content-Length", std::to_string(text.size()));
    reply.body = std::make_unique<io::StringReader>(std::move(text));
    return reply;
  }
  return handler_.serve(request);
}

} // namespace http
} // namespace rawx

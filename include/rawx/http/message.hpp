#ifndef RAWX_HTTP_MESSAGE_HPP
#define RAWX_HTTP_MESSAGE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "rawx/io/stream.hpp"

namespace rawx {
namespace http {

// Field names compare case-insensitively
struct FieldLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, FieldLess>;

// Body of an incoming request, consumed block by block
class RequestBody : public io::Reader {
public:
  // Declared Content-Length, nothing for chunked or unknown length
  virtual std::optional<std::uint64_t> content_length() const = 0;
  // Trailer fields of a chunked body, complete once read() returned 0
  virtual const HeaderMap& trailers() const = 0;
};

struct Request {
  std::string method;
  std::string target;
  HeaderMap headers;
  // Owned by the transport, valid for the whole request
  RequestBody* body = nullptr;

  // Value of a header, empty when absent
  std::string header(const std::string& name) const;
};

// Result of a pipeline, written once by the transport: status line and
// headers first, then the body source streamed until it is exhausted.
struct Reply {
  unsigned status = 200;
  HeaderMap headers;
  std::unique_ptr<io::Reader> body;

  void set_header(const std::string& name, const std::string& value) {
    headers[name] = value;
  }
};

inline Reply make_reply(unsigned status) {
  Reply reply;
  reply.status = status;
  return reply;
}

} // namespace http
} // namespace rawx

#endif // RAWX_HTTP_MESSAGE_HPP

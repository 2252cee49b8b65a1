#ifndef RAWX_CHUNK_HANDLER_HPP
#define RAWX_CHUNK_HANDLER_HPP

#include <array>
#include <string>
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/services.hpp"
#include "rawx/http/message.hpp"

namespace rawx {
namespace chunk {

// Uniform signature of the per-verb pipelines
using Pipeline = http::Reply (*)(const Services&, const RequestContext&, http::Request&);

struct Route {
  const char* method;
  stats::Verb verb;
  Pipeline pipeline;
};

// HEAD: replies 204 with the chunk size, no body
http::Reply check_chunk(const Services& services, const RequestContext& context,
                        http::Request& request);
// DELETE: replies 204 once the chunk is removed
http::Reply remove_chunk(const Services& services, const RequestContext& context,
                         http::Request& request);

// Verb to pipeline table
const std::array<Route, 5>& chunk_routes();

// Error reply: status from the error kind, reason in X-Error, no body
http::Reply error_reply(const ChunkError& error);

// Entry point for requests on /<chunk ID>
class ChunkHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkHandler(Services services);


  // ---- REQUEST PROCESSING ----
  // Validates the chunk ID, then runs the pipeline of the request verb.
  // Never throws: every failure becomes an error reply.
  http::Reply serve(http::Request& request);
  // Accounting category of a method
  static stats::Verb verb_for(const std::string& method);


  // ---- GETTERS ----
  const Services& services() const { return services_; }

private:
  // ---- PARAMETERS ----
  Services services_;
};

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_HANDLER_HPP

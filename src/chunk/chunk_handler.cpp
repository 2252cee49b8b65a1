#include "rawx/chunk/chunk_handler.hpp"
#include "rawx/chunk/copy.hpp"
#include "rawx/chunk/download.hpp"
#include "rawx/chunk/upload.hpp"
#include <optional>
#include <boost/log/trivial.hpp>

namespace rawx {
namespace chunk {

namespace {

constexpr const char* REQUEST_ID_HEADER = "X-oio-req-id";

const Route* find_route(const std::string& method) {
  for (const auto& route : chunk_routes()) {
    if (method == route.method) {
      return &route;
    }
  }
  return nullptr;
}

} // namespace

//==============================================
// CHECK AND DELETE PIPELINES
//==============================================

http::Reply check_chunk(const Services& services, const RequestContext& context,
                        http::Request&) {
  auto in = services.repository.get(context.chunk_id);

  http::Reply reply = http::make_reply(204);
  reply.set_header("Content-Length", std::to_string(in->size()));
  reply.set_header("Accept-Ranges", "bytes");
  in->close();

  RAWX_LOG_DEBUG(services.logger) << "Check: " << context.chunk_id << " holds "
                                  << reply.headers["Content-Length"] << " bytes";
  return reply;
}

http::Reply remove_chunk(const Services& services, const RequestContext& context,
                         http::Request&) {
  services.repository.del(context.chunk_id);
  RAWX_LOG_INFO(services.logger) << "Delete: Removed " << context.chunk_id;
  return http::make_reply(204);
}


//==============================================
// DISPATCH
//==============================================

const std::array<Route, 5>& chunk_routes() {
  static const std::array<Route, 5> routes = {{
    {"PUT", stats::Verb::PUT, &upload_chunk},
    {"COPY", stats::Verb::COPY, &copy_chunk},
    {"HEAD", stats::Verb::HEAD, &check_chunk},
    {"GET", stats::Verb::GET, &download_chunk},
    {"DELETE", stats::Verb::DELETE, &remove_chunk},
  }};
  return routes;
}

http::Reply error_reply(const ChunkError& error) {
  http::Reply reply = http::make_reply(error.status());
  reply.set_header("X-Error", error.what());
  return reply;
}

ChunkHandler::ChunkHandler(Services services)
  : services_(std::move(services)) {
  BOOST_LOG_TRIVIAL(info) << "Chunk handler: Serving chunks"
                          << (services_.settings.compress ? " with zlib compression" : "");
}

stats::Verb ChunkHandler::verb_for(const std::string& method) {
  const Route* route = find_route(method);
  return route ? route->verb : stats::Verb::OTHER;
}

http::Reply ChunkHandler::serve(http::Request& request) {
  auto& log = services_.logger;

  // The identifier is checked once, before any verb-specific work
  std::optional<ChunkId> chunk_id;
  try {
    chunk_id = ChunkId::parse(request.target);
  }
  catch (const ChunkError& e) {
    RAWX_LOG_WARN(log) << "Chunk handler: " << request.method << " " << request.target << ": " << e.what();
    return error_reply(e);
  }

  const Route* route = find_route(request.method);
  if (!route) {
    RAWX_LOG_WARN(log) << "Chunk handler: Method not allowed: " << request.method;
    return http::make_reply(405);
  }

  RequestContext context{*chunk_id, route->verb, request.header(REQUEST_ID_HEADER)};
  RAWX_LOG_DEBUG(log) << "Chunk handler: " << request.method << " " << context.chunk_id
                      << (context.request_id.empty() ? "" : " req-id " + context.request_id);

  try {
    return route->pipeline(services_, context, request);
  }
  catch (const ChunkError& e) {
    RAWX_LOG_WARN(log) << "Chunk handler: " << request.method << " " << context.chunk_id
                       << " failed: " << e.what();
    return error_reply(e);
  }
  catch (const std::exception& e) {
    RAWX_LOG_ERROR(log) << "Chunk handler: " << request.method << " " << context.chunk_id
                        << " failed: " << e.what();
    return error_reply(ChunkError(ErrorKind::STORAGE, e.what()));
  }
}

} // namespace chunk
} // namespace rawx

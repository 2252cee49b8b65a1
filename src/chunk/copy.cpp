#include "rawx/chunk/copy.hpp"
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/chunk_metadata.hpp"

namespace rawx {
namespace chunk {

http::Reply copy_chunk(const Services& services, const RequestContext& context,
                       http::Request& request) {
  auto& log = services.logger;

  ChunkId destination = parse_destination(request.headers, services.settings.service_url,
                                          context.chunk_id);
  std::string full_path = parse_full_path(request.headers);

  auto out = services.repository.link(destination, context.chunk_id);

  try {
    save_full_path(full_path, destination, *out);
  }
  catch (const std::exception& e) {
    RAWX_LOG_ERROR(log) << "Copy: Aborting link " << context.chunk_id << " -> " << destination
                        << ": " << e.what();
    out->abort();
    throw;
  }

  out->commit();
  RAWX_LOG_INFO(log) << "Copy: Linked " << context.chunk_id << " -> " << destination;
  return http::make_reply(201);
}

} // namespace chunk
} // namespace rawx

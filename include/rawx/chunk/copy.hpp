#ifndef RAWX_CHUNK_COPY_HPP
#define RAWX_CHUNK_COPY_HPP

#include "rawx/chunk/services.hpp"
#include "rawx/http/message.hpp"

namespace rawx {
namespace chunk {

// COPY: makes the chunk named by the Destination header share the bytes of
// the request chunk, and records its full path. Replies 201.
http::Reply copy_chunk(const Services& services, const RequestContext& context,
                       http::Request& request);

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_COPY_HPP

#ifndef RAWX_CHUNK_DOWNLOAD_HPP
#define RAWX_CHUNK_DOWNLOAD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "rawx/chunk/services.hpp"
#include "rawx/http/message.hpp"

namespace rawx {
namespace chunk {

// Single byte range: size bytes starting at offset
struct RangeSpec {
  std::uint64_t offset;
  std::uint64_t size;
};

// Parses "bytes=<offset>-<last>" (inclusive last byte, last > offset).
// An empty header means the whole chunk. Anything else, multiple ranges
// included, throws ChunkError(INVALID_RANGE).
std::optional<RangeSpec> parse_range(const std::string& value);

// GET: replies 200/206/204 with the chunk body as a streamed source
http::Reply download_chunk(const Services& services, const RequestContext& context,
                           http::Request& request);

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_DOWNLOAD_HPP

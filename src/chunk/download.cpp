#include "rawx/chunk/download.hpp"
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/chunk_metadata.hpp"
#include "rawx/io/deflate_writer.hpp"
#include <algorithm>
#include <cctype>

namespace rawx {
namespace chunk {

namespace {

constexpr const char* RANGE_UNIT = "bytes=";

// Reads a decimal number at pos, advancing it. False when no digit is found.
bool read_number(const std::string& s, std::size_t& pos, std::uint64_t& value) {
  std::size_t start = pos;
  value = 0;
  while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
    std::uint64_t digit = static_cast<std::uint64_t>(s[pos] - '0');
    if (value > (UINT64_MAX - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
    ++pos;
  }
  return pos > start;
}

} // namespace

std::optional<RangeSpec> parse_range(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }

  std::string unit(RANGE_UNIT);
  if (value.compare(0, unit.size(), unit) != 0) {
    throw ChunkError(ErrorKind::INVALID_RANGE, value);
  }

  std::size_t pos = unit.size();
  std::uint64_t offset = 0;
  std::uint64_t last = 0;
  if (!read_number(value, pos, offset)
      || pos >= value.size() || value[pos++] != '-'
      || !read_number(value, pos, last)
      || pos != value.size()
      || last <= offset) {
    throw ChunkError(ErrorKind::INVALID_RANGE, value);
  }

  return RangeSpec{offset, last - offset + 1};
}

http::Reply download_chunk(const Services& services, const RequestContext& context,
                           http::Request& request) {
  auto& log = services.logger;

  // Closed when the reply body is done with it, or on any early exit
  std::unique_ptr<store::ReadHandle> in = services.repository.get(context.chunk_id);

  http::Reply reply;
  try {
    ChunkMetadata meta = load_attributes(*in, context.chunk_id);

    std::optional<RangeSpec> range = parse_range(request.header("Range"));

    // Compressed chunks are stored as is and never inflated on the way out
    if (!meta.compression.empty()) {
      if (meta.compression == io::COMPRESSION_ZLIB) {
        RAWX_LOG_ERROR(log) << "Download: " << context.chunk_id << " is zlib-compressed, reading is not managed";
      } else {
        RAWX_LOG_ERROR(log) << "Download: " << context.chunk_id << " has unknown compression " << meta.compression;
      }
      throw ChunkError(ErrorKind::COMPRESSION_NOT_MANAGED, meta.compression);
    }

    const std::uint64_t chunk_size = in->size();
    fill_headers(meta, reply.headers);
    reply.set_header("Accept-Ranges", "bytes");

    if (range) {
      if (range->offset >= chunk_size) {
        throw ChunkError(ErrorKind::RANGE_NOT_SATISFIABLE, request.header("Range"));
      }
      range->size = std::min(range->size, chunk_size - range->offset);

      if (range->offset > 0) {
        in->seek(range->offset);
      }

      reply.set_header("Content-Range", "bytes " + std::to_string(range->offset) + "-"
                       + std::to_string(range->offset + range->size) + "/"
                       + std::to_string(range->size));
      reply.set_header("Content-Length", std::to_string(range->size));
      reply.status = range->size > 0 ? 206 : 204;
      if (range->size > 0) {
        reply.body = std::make_unique<io::LimitedReader>(std::move(in), range->size);
      }
    } else {
      reply.set_header("Content-Length", std::to_string(chunk_size));
      reply.status = chunk_size > 0 ? 200 : 204;
      if (chunk_size > 0) {
        reply.body = std::move(in);
      }
    }
  } catch (const std::exception&) {
    if (in) {
      in->close();
    }
    throw;
  }

  // Nothing to stream
  if (in) {
    in->close();
  }

  RAWX_LOG_DEBUG(log) << "Download: Serving " << context.chunk_id << " with status " << reply.status;
  return reply;
}

} // namespace chunk
} // namespace rawx

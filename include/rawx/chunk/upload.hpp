#ifndef RAWX_CHUNK_UPLOAD_HPP
#define RAWX_CHUNK_UPLOAD_HPP

#include <cstdint>
#include <string>
#include <variant>
#include "rawx/chunk/services.hpp"
#include "rawx/http/message.hpp"
#include "rawx/io/stream.hpp"

namespace rawx {
namespace chunk {

// The client announced exactly this many bytes
struct Known {
  std::uint64_t count;
};

// The body runs until end of stream (chunked transfer)
struct Unbounded {};

using ExpectedLength = std::variant<Known, Unbounded>;

struct UploadContext {
  io::Reader& in;
  ExpectedLength length;
  // Filled by put_data()
  std::uint64_t bytes_read = 0;
  std::string hash;
};

// Copies the upload body into out in blocks of io::BLOCK_SIZE, computing the
// MD5 of the bytes read from the client. A known length stops after exactly
// that many bytes and fails if the body ends early.
void put_data(io::Writer& out, UploadContext& upload);

// PUT: stores a new chunk, replies 201 with the computed hash
http::Reply upload_chunk(const Services& services, const RequestContext& context,
                         http::Request& request);

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_UPLOAD_HPP

#include "rawx/chunk/upload.hpp"
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/chunk_metadata.hpp"
#include "rawx/crypto/md5_digest.hpp"
#include "rawx/io/deflate_writer.hpp"
#include <algorithm>
#include <vector>

namespace rawx {
namespace chunk {

//==============================================
// BODY TRANSFER
//==============================================

void put_data(io::Writer& out, UploadContext& upload) {
  crypto::Md5Digest digest;
  std::vector<char> buffer(io::BLOCK_SIZE);

  const Known* known = std::get_if<Known>(&upload.length);
  std::uint64_t remaining = known ? known->count : 0;

  for (;;) {
    std::size_t max = buffer.size();
    if (known) {
      if (remaining == 0) {
        break;
      }
      max = static_cast<std::size_t>(std::min<std::uint64_t>(max, remaining));
    }

    std::size_t n = upload.in.read(buffer.data(), max);
    if (n == 0) {
      if (known) {
        throw ChunkError(ErrorKind::STORAGE, "body ended " + std::to_string(remaining)
                         + " bytes before the announced length");
      }
      // Clean end of a chunked body
      break;
    }

    out.write(buffer.data(), n);
    digest.update(buffer.data(), n);
    upload.bytes_read += n;
    if (known) {
      remaining -= n;
    }
  }

  upload.hash = digest.hex_digest();
}


//==============================================
// UPLOAD PIPELINE
//==============================================

http::Reply upload_chunk(const Services& services, const RequestContext& context,
                         http::Request& request) {
  auto& log = services.logger;

  ChunkMetadata meta;
  try {
    meta = parse_upload_headers(request.headers, context.chunk_id);
  }
  catch (const ChunkError& e) {
    RAWX_LOG_WARN(log) << "Upload: Header error for " << context.chunk_id << ": " << e.what();
    throw;
  }

  if (!request.body) {
    throw ChunkError(ErrorKind::STORAGE, "no request body");
  }

  auto out = services.repository.put(context.chunk_id);

  UploadContext upload{*request.body, Unbounded{}};
  if (auto length = request.body->content_length()) {
    upload.length = Known{*length};
  }

  try {
    if (services.settings.compress) {
      io::DeflateWriter compressor(*out);
      put_data(compressor, upload);
      compressor.close();
      meta.compression = io::COMPRESSION_ZLIB;
    } else {
      put_data(*out, upload);
    }
    RAWX_LOG_DEBUG(log) << "Upload: Received " << upload.bytes_read << " bytes for " << context.chunk_id;

    // Trailers are only complete once the body has been consumed
    check_declared_content(request.headers, request.body->trailers(), upload.hash, upload.bytes_read);

    meta.chunk_hash = upload.hash;
    meta.chunk_size = std::to_string(upload.bytes_read);
    save_attributes(meta, *out);
  }
  catch (const std::exception& e) {
    RAWX_LOG_ERROR(log) << "Upload: Aborting " << context.chunk_id << ": " << e.what();
    out->abort();
    throw;
  }

  try {
    services.notifier.notify_new(notify::EVENT_CHUNK_NEW, meta, services.settings.notify_context);
  }
  catch (const std::exception& e) {
    RAWX_LOG_WARN(log) << "Upload: Notification failed for " << context.chunk_id << ": " << e.what();
  }

  out->commit();
  RAWX_LOG_INFO(log) << "Upload: Created " << context.chunk_id << " (" << upload.bytes_read
                     << " bytes, hash " << upload.hash << ")";

  http::Reply reply = http::make_reply(201);
  reply.set_header(header::REPLY_CHUNK_HASH, upload.hash);
  return reply;
}

} // namespace chunk
} // namespace rawx

#ifndef RAWX_CHUNK_METADATA_HPP
#define RAWX_CHUNK_METADATA_HPP

#include <cstdint>
#include <string>
#include "rawx/chunk/chunk_id.hpp"
#include "rawx/http/message.hpp"
#include "rawx/store/repository.hpp"

namespace rawx {
namespace chunk {

// Request and response headers carrying chunk metadata
namespace header {
constexpr const char* CONTAINER_ID = "X-oio-Chunk-Meta-Container-Id";
constexpr const char* CONTENT_ID = "X-oio-Chunk-Meta-Content-Id";
constexpr const char* CONTENT_PATH = "X-oio-Chunk-Meta-Content-Path";
constexpr const char* CONTENT_VERSION = "X-oio-Chunk-Meta-Content-Version";
constexpr const char* CONTENT_STORAGE_POLICY = "X-oio-Chunk-Meta-Content-Storage-Policy";
constexpr const char* CONTENT_CHUNK_METHOD = "X-oio-Chunk-Meta-Content-Chunk-Method";
constexpr const char* CONTENT_MIME_TYPE = "X-oio-Chunk-Meta-Content-Mime-Type";
constexpr const char* CHUNK_ID = "X-oio-Chunk-Meta-Chunk-Id";
constexpr const char* CHUNK_POSITION = "X-oio-Chunk-Meta-Chunk-Pos";
constexpr const char* CHUNK_SIZE = "X-oio-Chunk-Meta-Chunk-Size";
constexpr const char* CHUNK_HASH = "X-oio-Chunk-Meta-Chunk-Hash";
constexpr const char* FULL_PATH = "X-oio-Chunk-Meta-Full-Path";
constexpr const char* COMPRESSION = "X-oio-Chunk-Meta-Compression";
constexpr const char* DESTINATION = "Destination";
constexpr const char* REPLY_CHUNK_HASH = "chunkhash";
} // namespace header

// Extended attributes persisted on the chunk file
namespace attr {
constexpr const char* CONTAINER_ID = "user.grid.content.container";
constexpr const char* CONTENT_ID = "user.grid.content.id";
constexpr const char* CONTENT_PATH = "user.grid.content.path";
constexpr const char* CONTENT_VERSION = "user.grid.content.version";
constexpr const char* CONTENT_STORAGE_POLICY = "user.grid.content.storage_policy";
constexpr const char* CONTENT_CHUNK_METHOD = "user.grid.content.chunk_method";
constexpr const char* CONTENT_MIME_TYPE = "user.grid.content.mime_type";
constexpr const char* CHUNK_POSITION = "user.grid.chunk.position";
constexpr const char* CHUNK_SIZE = "user.grid.chunk.size";
constexpr const char* CHUNK_HASH = "user.grid.chunk.hash";
constexpr const char* COMPRESSION = "user.grid.compression";
// Followed by the chunk ID: hard links share one attribute set
constexpr const char* FULL_PATH_PREFIX = "user.oio.content.fullpath:";
} // namespace attr

// Metadata of a stored chunk. Empty fields are absent.
struct ChunkMetadata {
  std::string container_id;
  std::string content_id;
  std::string content_path;
  std::string content_version;
  std::string content_storage_policy;
  std::string content_chunk_method;
  std::string content_mime_type;
  std::string chunk_id;
  std::string chunk_position;
  std::string chunk_size;
  std::string chunk_hash;
  std::string compression;
  std::string full_path;
};


// ---- HEADER PARSING ----
// Builds the metadata of an upload from its request headers.
// Throws HeaderError(MISSING_HEADER / INVALID_HEADER) naming the faulty header.
ChunkMetadata parse_upload_headers(const http::HeaderMap& headers, const ChunkId& id);
// Checks the hash and size declared by the client, in trailers or else in headers,
// against what was actually received
void check_declared_content(const http::HeaderMap& headers, const http::HeaderMap& trailers,
                            const std::string& computed_hash, std::uint64_t computed_size);
// Extracts the target of a COPY from the Destination header
ChunkId parse_destination(const http::HeaderMap& headers, const std::string& service_url,
                          const ChunkId& source);
std::string parse_full_path(const http::HeaderMap& headers);


// ---- PERSISTENCE ----
void save_attributes(const ChunkMetadata& meta, store::WriteHandle& out);
void save_full_path(const std::string& full_path, const ChunkId& id, store::WriteHandle& out);
// Absent attributes load as empty fields
ChunkMetadata load_attributes(const store::ReadHandle& in, const ChunkId& id);


// ---- RENDERING ----
void fill_headers(const ChunkMetadata& meta, http::HeaderMap& headers);

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_METADATA_HPP

#include "rawx/chunk/chunk_metadata.hpp"
#include "rawx/chunk/chunk_error.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace rawx {
namespace chunk {

namespace {

struct Field {
  std::string ChunkMetadata::* member;
  const char* header;
  const char* attribute;
};

// Fields persisted one to one as attributes. chunk_id comes from the
// request path, full_path has a per-chunk attribute name.
const std::array<Field, 11> PERSISTED_FIELDS = {{
  {&ChunkMetadata::container_id, header::CONTAINER_ID, attr::CONTAINER_ID},
  {&ChunkMetadata::content_id, header::CONTENT_ID, attr::CONTENT_ID},
  {&ChunkMetadata::content_path, header::CONTENT_PATH, attr::CONTENT_PATH},
  {&ChunkMetadata::content_version, header::CONTENT_VERSION, attr::CONTENT_VERSION},
  {&ChunkMetadata::content_storage_policy, header::CONTENT_STORAGE_POLICY, attr::CONTENT_STORAGE_POLICY},
  {&ChunkMetadata::content_chunk_method, header::CONTENT_CHUNK_METHOD, attr::CONTENT_CHUNK_METHOD},
  {&ChunkMetadata::content_mime_type, header::CONTENT_MIME_TYPE, attr::CONTENT_MIME_TYPE},
  {&ChunkMetadata::chunk_position, header::CHUNK_POSITION, attr::CHUNK_POSITION},
  {&ChunkMetadata::chunk_size, header::CHUNK_SIZE, attr::CHUNK_SIZE},
  {&ChunkMetadata::chunk_hash, header::CHUNK_HASH, attr::CHUNK_HASH},
  {&ChunkMetadata::compression, header::COMPRESSION, attr::COMPRESSION},
}};

std::string lookup(const http::HeaderMap& headers, const char* name) {
  auto it = headers.find(name);
  return it == headers.end() ? std::string() : it->second;
}

std::string mandatory(const http::HeaderMap& headers, const char* name) {
  std::string value = lookup(headers, name);
  if (value.empty()) {
    throw HeaderError(ErrorKind::MISSING_HEADER, name);
  }
  return value;
}

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool is_decimal(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(),
    [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "N" for plain chunks, "N.M" for sub-chunks of erasure-coded contents
bool is_position(const std::string& s) {
  auto dot = s.find('.');
  if (dot == std::string::npos) {
    return is_decimal(s);
  }
  return is_decimal(s.substr(0, dot)) && is_decimal(s.substr(dot + 1));
}

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && to_upper(a) == to_upper(b);
}

} // namespace


//==============================================
// HEADER PARSING
//==============================================

ChunkMetadata parse_upload_headers(const http::HeaderMap& headers, const ChunkId& id) {
  ChunkMetadata meta;

  meta.container_id = to_upper(mandatory(headers, header::CONTAINER_ID));
  if (!is_hex_string(meta.container_id, 64)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CONTAINER_ID);
  }

  meta.content_id = to_upper(mandatory(headers, header::CONTENT_ID));
  if (!is_hex_string(meta.content_id)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CONTENT_ID);
  }

  meta.content_path = mandatory(headers, header::CONTENT_PATH);

  meta.content_version = mandatory(headers, header::CONTENT_VERSION);
  if (!is_decimal(meta.content_version)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CONTENT_VERSION);
  }

  meta.content_storage_policy = mandatory(headers, header::CONTENT_STORAGE_POLICY);
  meta.content_chunk_method = mandatory(headers, header::CONTENT_CHUNK_METHOD);
  meta.content_mime_type = lookup(headers, header::CONTENT_MIME_TYPE);

  meta.chunk_position = mandatory(headers, header::CHUNK_POSITION);
  if (!is_position(meta.chunk_position)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CHUNK_POSITION);
  }

  // Optional, but it must name the chunk of the request path
  std::string declared_id = lookup(headers, header::CHUNK_ID);
  if (!declared_id.empty() && !iequals(declared_id, id.str())) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CHUNK_ID);
  }
  meta.chunk_id = id.str();

  std::string declared_size = lookup(headers, header::CHUNK_SIZE);
  if (!declared_size.empty() && !is_decimal(declared_size)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CHUNK_SIZE);
  }

  meta.full_path = lookup(headers, header::FULL_PATH);
  return meta;
}

void check_declared_content(const http::HeaderMap& headers, const http::HeaderMap& trailers,
                            const std::string& computed_hash, std::uint64_t computed_size) {
  std::string declared_hash = lookup(trailers, header::CHUNK_HASH);
  if (declared_hash.empty()) {
    declared_hash = lookup(headers, header::CHUNK_HASH);
  }
  if (!declared_hash.empty() && !iequals(declared_hash, computed_hash)) {
    BOOST_LOG_TRIVIAL(warning) << "Metadata: Declared hash " << declared_hash
                               << " differs from computed " << computed_hash;
    throw ChunkError(ErrorKind::CHECKSUM_MISMATCH, declared_hash);
  }

  std::string declared_size = lookup(trailers, header::CHUNK_SIZE);
  if (declared_size.empty()) {
    declared_size = lookup(headers, header::CHUNK_SIZE);
  }
  if (!declared_size.empty()
      && (!is_decimal(declared_size) || declared_size != std::to_string(computed_size))) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::CHUNK_SIZE);
  }
}

ChunkId parse_destination(const http::HeaderMap& headers, const std::string& service_url,
                          const ChunkId& source) {
  std::string destination = mandatory(headers, header::DESTINATION);

  // Either an absolute URL "http://host:port/ID" or a bare path
  std::string host;
  std::string path = destination;
  auto scheme = destination.find("://");
  if (scheme != std::string::npos) {
    auto start = scheme + 3;
    auto slash = destination.find('/', start);
    host = destination.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    path = slash == std::string::npos ? std::string() : destination.substr(slash);
  }

  if (!host.empty() && !service_url.empty() && host != service_url) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::DESTINATION);
  }

  std::string raw = path_basename(path);
  if (!is_hex_string(raw, ChunkId::LENGTH)) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::DESTINATION);
  }

  ChunkId target = ChunkId::from_string(raw);
  if (target == source) {
    throw HeaderError(ErrorKind::INVALID_HEADER, header::DESTINATION);
  }
  return target;
}

std::string parse_full_path(const http::HeaderMap& headers) {
  return mandatory(headers, header::FULL_PATH);
}


//==============================================
// PERSISTENCE
//==============================================

void save_attributes(const ChunkMetadata& meta, store::WriteHandle& out) {
  for (const auto& field : PERSISTED_FIELDS) {
    const std::string& value = meta.*(field.member);
    if (!value.empty()) {
      out.set_attr(field.attribute, value);
    }
  }

  if (!meta.full_path.empty()) {
    save_full_path(meta.full_path, ChunkId::from_string(meta.chunk_id), out);
  }
}

void save_full_path(const std::string& full_path, const ChunkId& id, store::WriteHandle& out) {
  out.set_attr(std::string(attr::FULL_PATH_PREFIX) + id.str(), full_path);
}

ChunkMetadata load_attributes(const store::ReadHandle& in, const ChunkId& id) {
  ChunkMetadata meta;

  for (const auto& field : PERSISTED_FIELDS) {
    if (auto value = in.get_attr(field.attribute)) {
      meta.*(field.member) = *value;
    }
  }

  meta.chunk_id = id.str();
  if (auto full_path = in.get_attr(std::string(attr::FULL_PATH_PREFIX) + id.str())) {
    meta.full_path = *full_path;
  }
  return meta;
}


//==============================================
// RENDERING
//==============================================

void fill_headers(const ChunkMetadata& meta, http::HeaderMap& headers) {
  for (const auto& field : PERSISTED_FIELDS) {
    const std::string& value = meta.*(field.member);
    if (!value.empty()) {
      headers[field.header] = value;
    }
  }

  if (!meta.chunk_id.empty()) {
    headers[header::CHUNK_ID] = meta.chunk_id;
  }
  if (!meta.full_path.empty()) {
    headers[header::FULL_PATH] = meta.full_path;
  }
}

} // namespace chunk
} // namespace rawx

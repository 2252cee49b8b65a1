#ifndef RAWX_CHUNK_ERROR_HPP
#define RAWX_CHUNK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rawx {
namespace chunk {

enum class ErrorKind {
  INVALID_CHUNK_ID,
  CHUNK_EXISTS,
  CHUNK_NOT_FOUND,
  MISSING_HEADER,
  INVALID_HEADER,
  INVALID_RANGE,
  RANGE_NOT_SATISFIABLE,
  COMPRESSION_NOT_MANAGED,
  CHECKSUM_MISMATCH,
  NOT_IMPLEMENTED,
  STORAGE
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_CHUNK_ID: return "Invalid chunk ID";
    case ErrorKind::CHUNK_EXISTS: return "Chunk already exists";
    case ErrorKind::CHUNK_NOT_FOUND: return "Chunk not found";
    case ErrorKind::MISSING_HEADER: return "Missing mandatory header";
    case ErrorKind::INVALID_HEADER: return "Invalid header";
    case ErrorKind::INVALID_RANGE: return "Invalid range";
    case ErrorKind::RANGE_NOT_SATISFIABLE: return "Range not satisfiable";
    case ErrorKind::COMPRESSION_NOT_MANAGED: return "Compression mode not managed";
    case ErrorKind::CHECKSUM_MISMATCH: return "Chunk hash mismatch";
    case ErrorKind::NOT_IMPLEMENTED: return "Not implemented";
    case ErrorKind::STORAGE: return "Storage error";
    default: return "Undefined error";
  }
}

// HTTP status reported to the client for each error kind
inline unsigned status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_CHUNK_ID:
    case ErrorKind::MISSING_HEADER:
    case ErrorKind::INVALID_HEADER:
    case ErrorKind::INVALID_RANGE:
      return 400;
    case ErrorKind::CHUNK_NOT_FOUND:
      return 404;
    case ErrorKind::CHUNK_EXISTS:
      return 409;
    case ErrorKind::RANGE_NOT_SATISFIABLE:
      return 416;
    case ErrorKind::NOT_IMPLEMENTED:
      return 501;
    default:
      return 500;
  }
}

class ChunkError : public std::runtime_error {
public:
  ChunkError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail.empty()
        ? std::string(error_kind_to_string(kind))
        : std::string(error_kind_to_string(kind)) + ": " + detail)
    , kind_(kind) {}

  explicit ChunkError(ErrorKind kind) : ChunkError(kind, "") {}

  ErrorKind kind() const { return kind_; }
  unsigned status() const { return status_for(kind_); }

private:
  ErrorKind kind_;
};

class HeaderError : public ChunkError {
public:
  HeaderError(ErrorKind kind, const std::string& header_name)
    : ChunkError(kind, header_name) {}
};

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_ERROR_HPP

#ifndef RAWX_CHUNK_ID_HPP
#define RAWX_CHUNK_ID_HPP

#include <string>
#include <ostream>

namespace rawx {
namespace chunk {

// Canonical identifier of a chunk: 64 uppercase hexadecimal characters.
// A ChunkId can only be obtained through parse(), so every instance is canonical.
class ChunkId {
public:
  static constexpr std::size_t LENGTH = 64;

  // Extracts the trailing segment of a request path and validates it.
  // Throws ChunkError(INVALID_CHUNK_ID) when it is not 64 hex characters.
  static ChunkId parse(const std::string& path);
  // Validates a bare identifier (no path component)
  static ChunkId from_string(const std::string& raw);

  const std::string& str() const { return value_; }

  bool operator==(const ChunkId& other) const { return value_ == other.value_; }
  bool operator!=(const ChunkId& other) const { return value_ != other.value_; }

private:
  explicit ChunkId(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

inline std::ostream& operator<<(std::ostream& out, const ChunkId& id) {
  return out << id.str();
}

// True when s only holds hexadecimal digits and, if length is not zero,
// has exactly that many characters. An empty string is never valid.
bool is_hex_string(const std::string& s, std::size_t length = 0);

// Returns the last non-empty segment of a URL path, query string excluded
std::string path_basename(const std::string& path);

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_ID_HPP

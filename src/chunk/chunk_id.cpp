#include "rawx/chunk/chunk_id.hpp"
#include "rawx/chunk/chunk_error.hpp"
#include <algorithm>
#include <cctype>

namespace rawx {
namespace chunk {

bool is_hex_string(const std::string& s, std::size_t length) {
  if (s.empty() || (length != 0 && s.size() != length)) {
    return false;
  }
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isxdigit(c) != 0;
  });
}

std::string path_basename(const std::string& path) {
  std::string clean = path.substr(0, path.find_first_of("?#"));

  // Ignore trailing slashes, "/abc/" names "abc"
  while (clean.size() > 1 && clean.back() == '/') {
    clean.pop_back();
  }

  auto slash = clean.find_last_of('/');
  if (slash == std::string::npos) {
    return clean;
  }
  return clean.substr(slash + 1);
}

ChunkId ChunkId::parse(const std::string& path) {
  return from_string(path_basename(path));
}

ChunkId ChunkId::from_string(const std::string& raw) {
  if (!is_hex_string(raw, LENGTH)) {
    throw ChunkError(ErrorKind::INVALID_CHUNK_ID, raw);
  }

  std::string canonical(raw);
  std::transform(canonical.begin(), canonical.end(), canonical.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return ChunkId(std::move(canonical));
}

} // namespace chunk
} // namespace rawx

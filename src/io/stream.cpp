#include "rawx/io/stream.hpp"
#include <algorithm>
#include <vector>

namespace rawx {
namespace io {

LimitedReader::LimitedReader(std::unique_ptr<Reader> sub, std::uint64_t limit)
  : sub_(std::move(sub))
  , remaining_(limit) {}

std::size_t LimitedReader::read(char* buffer, std::size_t size) {
  if (remaining_ == 0) {
    return 0;
  }

  auto max = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining_));
  std::size_t n = sub_->read(buffer, max);
  remaining_ -= n;
  return n;
}

std::size_t StringReader::read(char* buffer, std::size_t size) {
  std::size_t n = std::min(size, data_.size() - position_);
  std::copy_n(data_.data() + position_, n, buffer);
  position_ += n;
  return n;
}

std::uint64_t copy_stream(Reader& in, Writer& out, std::size_t block_size) {
  std::vector<char> buffer(block_size);
  std::uint64_t total = 0;

  for (;;) {
    std::size_t n = in.read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    out.write(buffer.data(), n);
    total += n;
  }
  return total;
}

} // namespace io
} // namespace rawx

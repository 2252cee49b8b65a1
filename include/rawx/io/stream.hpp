#ifndef RAWX_IO_STREAM_HPP
#define RAWX_IO_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rawx {
namespace io {

// Size of the blocks moved between client, storage and compressor
constexpr std::size_t BLOCK_SIZE = 1024 * 1024;

// Source of bytes. read() returns 0 at a clean end of stream and throws
// on any other failure.
class Reader {
public:
  virtual ~Reader() = default;
  virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

// Sink of bytes. write() consumes the whole buffer or throws.
class Writer {
public:
  virtual ~Writer() = default;
  virtual void write(const char* data, std::size_t size) = 0;
};

// Delivers at most `limit` bytes of the wrapped reader, whatever it still holds
class LimitedReader : public Reader {
public:
  LimitedReader(std::unique_ptr<Reader> sub, std::uint64_t limit);

  std::size_t read(char* buffer, std::size_t size) override;

  std::uint64_t remaining() const { return remaining_; }

private:
  std::unique_ptr<Reader> sub_;
  std::uint64_t remaining_;
};

// Serves an in-memory string, used for small generated replies
class StringReader : public Reader {
public:
  explicit StringReader(std::string data) : data_(std::move(data)) {}

  std::size_t read(char* buffer, std::size_t size) override;

private:
  std::string data_;
  std::size_t position_ = 0;
};

// Copies the reader into the writer block by block until end of stream.
// Returns the number of bytes moved.
std::uint64_t copy_stream(Reader& in, Writer& out, std::size_t block_size = BLOCK_SIZE);

} // namespace io
} // namespace rawx

#endif // RAWX_IO_STREAM_HPP

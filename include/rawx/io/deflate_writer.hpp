#ifndef RAWX_IO_DEFLATE_WRITER_HPP
#define RAWX_IO_DEFLATE_WRITER_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "rawx/io/stream.hpp"

namespace rawx {
namespace io {

// Tag persisted in the compression attribute of zlib-compressed chunks
constexpr const char* COMPRESSION_ZLIB = "zlib";

class CompressionError : public std::runtime_error {
public:
  explicit CompressionError(const std::string& message)
    : std::runtime_error("Compression error: " + message) {}
};

struct DeflateState;

// Compresses everything written to it into the wrapped writer, zlib format.
// close() flushes the final block; it must be called before the output is used.
class DeflateWriter : public Writer {
public:
  explicit DeflateWriter(Writer& out, int level = 6);
  ~DeflateWriter() override;

  DeflateWriter(const DeflateWriter&) = delete;
  DeflateWriter& operator=(const DeflateWriter&) = delete;

  void write(const char* data, std::size_t size) override;
  void close();

  std::uint64_t bytes_in() const { return bytes_in_; }
  std::uint64_t bytes_out() const { return bytes_out_; }

private:
  Writer& out_;
  std::unique_ptr<DeflateState> state_;
  std::vector<char> buffer_;
  bool closed_ = false;
  std::uint64_t bytes_in_ = 0;
  std::uint64_t bytes_out_ = 0;

  // Runs deflate with the given flush mode until zlib stops producing output
  void pump(int flush);
};

} // namespace io
} // namespace rawx

#endif // RAWX_IO_DEFLATE_WRITER_HPP

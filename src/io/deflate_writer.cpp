#include "rawx/io/deflate_writer.hpp"
#include <zlib.h>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace rawx {
namespace io {

struct DeflateState {
  z_stream stream;
};

DeflateWriter::DeflateWriter(Writer& out, int level)
  : out_(out)
  , state_(std::make_unique<DeflateState>())
  , buffer_(BLOCK_SIZE) {
  std::memset(&state_->stream, 0, sizeof(state_->stream));
  if (deflateInit(&state_->stream, level) != Z_OK) {
    throw CompressionError("failed to initialize zlib stream");
  }
}

DeflateWriter::~DeflateWriter() {
  deflateEnd(&state_->stream);
}

void DeflateWriter::write(const char* data, std::size_t size) {
  if (closed_) {
    throw CompressionError("write after close");
  }

  z_stream& zs = state_->stream;
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  zs.avail_in = static_cast<uInt>(size);
  pump(Z_NO_FLUSH);
  bytes_in_ += size;
}

void DeflateWriter::close() {
  if (closed_) {
    return;
  }

  z_stream& zs = state_->stream;
  zs.next_in = nullptr;
  zs.avail_in = 0;
  pump(Z_FINISH);
  closed_ = true;

  BOOST_LOG_TRIVIAL(debug) << "Deflate: Compressed " << bytes_in_ << " bytes into " << bytes_out_;
}

void DeflateWriter::pump(int flush) {
  z_stream& zs = state_->stream;

  for (;;) {
    zs.next_out = reinterpret_cast<Bytef*>(buffer_.data());
    zs.avail_out = static_cast<uInt>(buffer_.size());

    int rc = deflate(&zs, flush);
    if (rc == Z_STREAM_ERROR) {
      throw CompressionError("deflate failed");
    }

    std::size_t produced = buffer_.size() - zs.avail_out;
    if (produced > 0) {
      out_.write(buffer_.data(), produced);
      bytes_out_ += produced;
    }

    if (flush == Z_FINISH) {
      if (rc == Z_STREAM_END) {
        return;
      }
    } else if (zs.avail_out != 0) {
      // Input fully consumed, nothing pending in zlib's window
      return;
    }
  }
}

} // namespace io
} // namespace rawx

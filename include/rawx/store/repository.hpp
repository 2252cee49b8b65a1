#ifndef RAWX_STORE_REPOSITORY_HPP
#define RAWX_STORE_REPOSITORY_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "rawx/chunk/chunk_error.hpp"
#include "rawx/chunk/chunk_id.hpp"
#include "rawx/io/stream.hpp"

namespace rawx {
namespace store {

// Failure raised by a repository; its kind is CHUNK_EXISTS, CHUNK_NOT_FOUND
// or STORAGE
class StoreError : public chunk::ChunkError {
public:
  StoreError(chunk::ErrorKind kind, const std::string& message)
    : chunk::ChunkError(kind, message) {}
  explicit StoreError(const std::string& message)
    : chunk::ChunkError(chunk::ErrorKind::STORAGE, message) {}
};

// In-flight write target. Exactly one of commit() or abort() ends its life:
// commit() makes the chunk visible under its identifier, abort() removes
// every trace of it.
class WriteHandle : public io::Writer {
public:
  virtual void set_attr(const std::string& name, const std::string& value) = 0;
  virtual void commit() = 0;
  virtual void abort() = 0;
};

// Opened, committed chunk
class ReadHandle : public io::Reader {
public:
  virtual std::uint64_t size() const = 0;
  virtual void seek(std::uint64_t offset) = 0;
  // Returns nothing when the attribute is not set on the chunk
  virtual std::optional<std::string> get_attr(const std::string& name) const = 0;
  virtual void close() = 0;
};

// Durable chunk storage. Implementations guarantee that of two concurrent
// put() or link() calls for the same identifier exactly one commits.
class Repository {
public:
  virtual ~Repository() = default;

  // Starts the creation of a new chunk; throws CHUNK_EXISTS when taken
  virtual std::unique_ptr<WriteHandle> put(const chunk::ChunkId& id) = 0;
  // Starts the creation of new_id sharing the bytes of source_id
  virtual std::unique_ptr<WriteHandle> link(const chunk::ChunkId& new_id,
                                            const chunk::ChunkId& source_id) = 0;
  // Opens a committed chunk; throws CHUNK_NOT_FOUND when absent
  virtual std::unique_ptr<ReadHandle> get(const chunk::ChunkId& id) = 0;
  // Removes a committed chunk; throws CHUNK_NOT_FOUND when absent
  virtual void del(const chunk::ChunkId& id) = 0;
};

} // namespace store
} // namespace rawx

#endif // RAWX_STORE_REPOSITORY_HPP

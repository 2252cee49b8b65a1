#ifndef RAWX_STORE_FILE_REPOSITORY_HPP
#define RAWX_STORE_FILE_REPOSITORY_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "rawx/store/repository.hpp"

namespace rawx {
namespace store {

// Suffix of the files holding chunks that are not committed yet
constexpr const char* PENDING_SUFFIX = ".pending";

// Repository laid out on a local filesystem. Chunk bytes live in plain files,
// metadata in their extended attributes.
class FileRepository : public Repository {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileRepository(const std::string& docroot, std::size_t hash_width = 3,
                          std::size_t hash_depth = 1, bool sync = false);


  // ---- CORE STORAGE OPERATIONS ----
  std::unique_ptr<WriteHandle> put(const chunk::ChunkId& id) override;
  std::unique_ptr<WriteHandle> link(const chunk::ChunkId& new_id,
                                    const chunk::ChunkId& source_id) override;
  std::unique_ptr<ReadHandle> get(const chunk::ChunkId& id) override;
  void del(const chunk::ChunkId& id) override;


  // ---- QUERY OPERATIONS ----
  // Checks if a committed chunk exists
  bool has(const chunk::ChunkId& id) const;
  // Returns the final location of a chunk:
  // {docroot}/{id[0:w]}/{id[w:2w]}/.../{id}
  std::filesystem::path path_for(const chunk::ChunkId& id) const;

  const std::filesystem::path& docroot() const { return docroot_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path docroot_;
  std::size_t hash_width_;
  std::size_t hash_depth_;
  bool sync_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

// Write target backed by a "<chunk>.pending" file
class FileWriteHandle : public WriteHandle {
public:
  FileWriteHandle(int fd, std::filesystem::path pending, std::filesystem::path final_path,
                  bool sync, bool linked);
  ~FileWriteHandle() override;

  FileWriteHandle(const FileWriteHandle&) = delete;
  FileWriteHandle& operator=(const FileWriteHandle&) = delete;

  void write(const char* data, std::size_t size) override;
  void set_attr(const std::string& name, const std::string& value) override;
  void commit() override;
  void abort() override;

private:
  int fd_;
  std::filesystem::path pending_;
  std::filesystem::path final_;
  bool sync_;
  // A linked handle shares its inode with the source chunk
  bool linked_;
  bool finished_ = false;
  std::vector<std::string> attrs_set_;

  void close_fd();
  void discard_pending();
};

class FileReadHandle : public ReadHandle {
public:
  FileReadHandle(int fd, std::uint64_t size);
  ~FileReadHandle() override;

  FileReadHandle(const FileReadHandle&) = delete;
  FileReadHandle& operator=(const FileReadHandle&) = delete;

  std::size_t read(char* buffer, std::size_t size) override;
  std::uint64_t size() const override { return size_; }
  void seek(std::uint64_t offset) override;
  std::optional<std::string> get_attr(const std::string& name) const override;
  void close() override;

private:
  int fd_;
  std::uint64_t size_;
};

} // namespace store
} // namespace rawx

#endif // RAWX_STORE_FILE_REPOSITORY_HPP

#include "rawx/store/file_repository.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace rawx {
namespace store {

using chunk::ErrorKind;

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileRepository::FileRepository(const std::string& docroot, std::size_t hash_width,
                               std::size_t hash_depth, bool sync)
  : docroot_(docroot)
  , hash_width_(hash_width)
  , hash_depth_(hash_depth)
  , sync_(sync) {
  BOOST_LOG_TRIVIAL(info) << "Repository: Initializing repository with docroot: " << docroot;

  if (hash_width_ * hash_depth_ >= chunk::ChunkId::LENGTH) {
    throw std::invalid_argument("Repository: hash width and depth exceed the chunk ID length");
  }

  check_directory_exists(docroot_);
  BOOST_LOG_TRIVIAL(debug) << "Repository: Docroot created/verified at: " << docroot;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<WriteHandle> FileRepository::put(const chunk::ChunkId& id) {
  std::filesystem::path final_path = path_for(id);
  std::filesystem::path pending = final_path.string() + PENDING_SUFFIX;
  BOOST_LOG_TRIVIAL(debug) << "Repository: Creating chunk at: " << final_path.string();

  if (std::filesystem::exists(final_path)) {
    throw StoreError(ErrorKind::CHUNK_EXISTS, id.str());
  }
  check_directory_exists(final_path.parent_path());

  // O_EXCL on the pending file serializes concurrent uploads of one ID
  int fd = ::open(pending.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    int err = errno;
    if (err == EEXIST) {
      throw StoreError(ErrorKind::CHUNK_EXISTS, id.str());
    }
    throw StoreError(errno_message("Failed to create", pending, err));
  }

  return std::make_unique<FileWriteHandle>(fd, pending, final_path, sync_, false);
}

std::unique_ptr<WriteHandle> FileRepository::link(const chunk::ChunkId& new_id,
                                                  const chunk::ChunkId& source_id) {
  std::filesystem::path source = path_for(source_id);
  std::filesystem::path final_path = path_for(new_id);
  std::filesystem::path pending = final_path.string() + PENDING_SUFFIX;
  BOOST_LOG_TRIVIAL(debug) << "Repository: Linking " << source.string() << " to " << final_path.string();

  if (!std::filesystem::exists(source)) {
    throw StoreError(ErrorKind::CHUNK_NOT_FOUND, source_id.str());
  }
  if (std::filesystem::exists(final_path)) {
    throw StoreError(ErrorKind::CHUNK_EXISTS, new_id.str());
  }
  check_directory_exists(final_path.parent_path());

  if (::link(source.c_str(), pending.c_str()) != 0) {
    int err = errno;
    if (err == EEXIST) {
      throw StoreError(ErrorKind::CHUNK_EXISTS, new_id.str());
    }
    if (err == ENOENT) {
      throw StoreError(ErrorKind::CHUNK_NOT_FOUND, source_id.str());
    }
    throw StoreError(errno_message("Failed to link", pending, err));
  }

  // Attributes are set through a descriptor on the shared inode
  int fd = ::open(pending.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    ::unlink(pending.c_str());
    throw StoreError(errno_message("Failed to open", pending, err));
  }

  return std::make_unique<FileWriteHandle>(fd, pending, final_path, sync_, true);
}

std::unique_ptr<ReadHandle> FileRepository::get(const chunk::ChunkId& id) {
  std::filesystem::path path = path_for(id);
  BOOST_LOG_TRIVIAL(debug) << "Repository: Opening chunk at: " << path.string();

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw StoreError(ErrorKind::CHUNK_NOT_FOUND, id.str());
    }
    throw StoreError(errno_message("Failed to open", path, err));
  }

  struct stat st;
  if (::fstat(fd, &st) != 0) {
    int err = errno;
    ::close(fd);
    throw StoreError(errno_message("Failed to stat", path, err));
  }

  return std::make_unique<FileReadHandle>(fd, static_cast<std::uint64_t>(st.st_size));
}

void FileRepository::del(const chunk::ChunkId& id) {
  std::filesystem::path path = path_for(id);
  BOOST_LOG_TRIVIAL(info) << "Repository: Removing chunk: " << id;

  if (::unlink(path.c_str()) != 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw StoreError(ErrorKind::CHUNK_NOT_FOUND, id.str());
    }
    BOOST_LOG_TRIVIAL(error) << "Repository: Failed to remove chunk: " << id;
    throw StoreError(errno_message("Failed to remove", path, err));
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileRepository::has(const chunk::ChunkId& id) const {
  return std::filesystem::exists(path_for(id));
}

std::filesystem::path FileRepository::path_for(const chunk::ChunkId& id) const {
  std::filesystem::path path = docroot_;
  const std::string& hex = id.str();

  for (std::size_t level = 0; level < hash_depth_; ++level) {
    path /= hex.substr(level * hash_width_, hash_width_);
  }
  path /= hex;
  return path;
}


//==============================================
// UTILITY METHODS 
//==============================================

void FileRepository::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw StoreError("Failed to create directory " + path.string() + ": " + ec.message());
  }
}


//==============================================
// WRITE HANDLE
//==============================================

FileWriteHandle::FileWriteHandle(int fd, std::filesystem::path pending,
                                 std::filesystem::path final_path, bool sync, bool linked)
  : fd_(fd)
  , pending_(std::move(pending))
  , final_(std::move(final_path))
  , sync_(sync)
  , linked_(linked) {}

FileWriteHandle::~FileWriteHandle() {
  if (!finished_) {
    BOOST_LOG_TRIVIAL(warning) << "Repository: Unfinished write handle, aborting: " << pending_.string();
    abort();
  }
}

void FileWriteHandle::write(const char* data, std::size_t size) {
  if (finished_ || linked_) {
    throw StoreError("Chunk not writable: " + pending_.string());
  }

  while (size > 0) {
    ssize_t n = ::write(fd_, data, size);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StoreError(errno_message("Failed to write", pending_, errno));
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
}

void FileWriteHandle::set_attr(const std::string& name, const std::string& value) {
  if (finished_) {
    throw StoreError("Chunk already closed: " + pending_.string());
  }
  if (::fsetxattr(fd_, name.c_str(), value.data(), value.size(), 0) != 0) {
    throw StoreError(errno_message("Failed to set attribute " + name + " on", pending_, errno));
  }
  attrs_set_.push_back(name);
}

void FileWriteHandle::commit() {
  if (finished_) {
    throw StoreError("Chunk already closed: " + pending_.string());
  }
  finished_ = true;

  if (sync_ && ::fsync(fd_) != 0) {
    int err = errno;
    close_fd();
    discard_pending();
    throw StoreError(errno_message("Failed to sync", pending_, err));
  }
  close_fd();

  // The final name is taken with link(), never rename(): the first writer wins
  if (::link(pending_.c_str(), final_.c_str()) != 0) {
    int err = errno;
    discard_pending();
    if (err == EEXIST) {
      throw StoreError(ErrorKind::CHUNK_EXISTS, final_.filename().string());
    }
    throw StoreError(errno_message("Failed to commit", final_, err));
  }

  discard_pending();
  BOOST_LOG_TRIVIAL(debug) << "Repository: Committed chunk at: " << final_.string();
}

void FileWriteHandle::abort() {
  if (finished_) {
    return;
  }
  finished_ = true;

  // A linked pending file shares its attributes with the source chunk
  if (linked_) {
    for (const auto& name : attrs_set_) {
      if (::fremovexattr(fd_, name.c_str()) != 0 && errno != ENODATA) {
        BOOST_LOG_TRIVIAL(error) << "Repository: Failed to remove attribute " << name
                                 << " from " << pending_.string() << ": " << std::strerror(errno);
      }
    }
  }

  close_fd();
  discard_pending();
  BOOST_LOG_TRIVIAL(debug) << "Repository: Aborted chunk at: " << pending_.string();
}

void FileWriteHandle::close_fd() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void FileWriteHandle::discard_pending() {
  if (::unlink(pending_.c_str()) != 0 && errno != ENOENT) {
    BOOST_LOG_TRIVIAL(error) << "Repository: Failed to remove " << pending_.string()
                             << ": " << std::strerror(errno);
  }
}


//==============================================
// READ HANDLE
//==============================================

FileReadHandle::FileReadHandle(int fd, std::uint64_t size)
  : fd_(fd)
  , size_(size) {}

FileReadHandle::~FileReadHandle() {
  close();
}

std::size_t FileReadHandle::read(char* buffer, std::size_t size) {
  if (fd_ < 0) {
    throw StoreError("Read on a closed chunk");
  }

  for (;;) {
    ssize_t n = ::read(fd_, buffer, size);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno != EINTR) {
      throw StoreError(std::string("Failed to read chunk: ") + std::strerror(errno));
    }
  }
}

void FileReadHandle::seek(std::uint64_t offset) {
  if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
    throw StoreError(std::string("Failed to seek chunk: ") + std::strerror(errno));
  }
}

std::optional<std::string> FileReadHandle::get_attr(const std::string& name) const {
  ssize_t len = ::fgetxattr(fd_, name.c_str(), nullptr, 0);
  if (len < 0) {
    if (errno == ENODATA || errno == ENOTSUP) {
      return std::nullopt;
    }
    throw StoreError("Failed to read attribute " + name + ": " + std::strerror(errno));
  }

  std::string value(static_cast<std::size_t>(len), '\0');
  if (len > 0) {
    len = ::fgetxattr(fd_, name.c_str(), value.data(), value.size());
    if (len < 0) {
      throw StoreError("Failed to read attribute " + name + ": " + std::strerror(errno));
    }
    value.resize(static_cast<std::size_t>(len));
  }
  return value;
}

void FileReadHandle::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace store
} // namespace rawx

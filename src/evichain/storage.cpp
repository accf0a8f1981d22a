#include "evichain/storage.hpp"
#include "evichain/errors.hpp"
#include "evichain/logger.h"

#include <cerrno>
#include <cppcodec/hex_lower.hpp>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sodium.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace evichain {

namespace {

std::string errnoMessage(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

// Keys never escape the root.
void checkKey(const std::string &key) {
  if (key.empty() || key.front() == '/')
    throwStorageFailure(key, "invalid storage key");
  for (const auto &part : fs::path(key)) {
    if (part == "..")
      throwStorageFailure(key, "storage key escapes the root");
  }
}

std::string tmpName() {
  unsigned char suffix[8];
  randombytes_buf(suffix, sizeof(suffix));
  return ".tmp-" + cppcodec::hex_lower::encode(suffix, sizeof(suffix));
}

/// Exclusive advisory lock held for the lifetime of the object.
class LockFile {
public:
  LockFile(const std::string &key, const fs::path &path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
      throwStorageFailure(key, errnoMessage("cannot open lock file"));
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR)
        continue;
      std::string msg = errnoMessage("cannot acquire lock");
      ::close(fd_);
      throwStorageFailure(key, msg);
    }
  }
  ~LockFile() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  LockFile(const LockFile &) = delete;
  LockFile &operator=(const LockFile &) = delete;

private:
  int fd_ = -1;
};

void writeAll(int fd, const std::string &bytes) {
  const char *p = bytes.data();
  size_t remaining = bytes.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "write");
    }
    p += n;
    remaining -= static_cast<size_t>(n);
  }
}

void makeParentDirectories(const std::string &key, const fs::path &target) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    throwStorageFailure(key, "cannot create directory: " + ec.message());
}

// Write @p bytes to a fresh, fsync'ed temporary file beside @p target and
// return its path. The parent directory must exist.
std::string stageTemporary(const std::string &key, const fs::path &target,
                           const std::string &bytes) {
  const fs::path dir = target.parent_path();
  const fs::path tmp = dir / tmpName();
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0)
    throwStorageFailure(key, errnoMessage("cannot create temporary file"));

  try {
    writeAll(fd, bytes);
    if (::fsync(fd) != 0)
      throw std::system_error(errno, std::generic_category(), "fsync");
  } catch (const std::system_error &e) {
    ::close(fd);
    ::unlink(tmp.c_str());
    throwStorageFailure(key, e.what());
  }
  if (::close(fd) != 0) {
    std::string msg = errnoMessage("close failed");
    ::unlink(tmp.c_str());
    throwStorageFailure(key, msg);
  }
  return tmp.string();
}

} // namespace

FileStorage::FileStorage(std::string root) : root_(std::move(root)) {
  if (sodium_init() < 0)
    throw std::runtime_error("Failed to initialize libsodium");
}

std::mutex &FileStorage::mutexFor(const std::string &key) {
  std::lock_guard<std::mutex> lock(locksMutex_);
  auto &slot = keyLocks_[key];
  if (!slot)
    slot = std::make_unique<std::mutex>();
  return *slot;
}

std::string FileStorage::resolve(const std::string &key) const {
  return (fs::path(root_) / key).string();
}

bool FileStorage::exists(const std::string &key) {
  checkKey(key);
  std::error_code ec;
  bool found = fs::exists(resolve(key), ec);
  if (ec)
    throwStorageFailure(key, ec.message());
  return found;
}

std::optional<std::string> FileStorage::read(const std::string &key) {
  checkKey(key);
  const fs::path path = resolve(key);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec)
      throwStorageFailure(key, ec.message());
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throwStorageFailure(key, errnoMessage("cannot open for reading"));
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad())
    throwStorageFailure(key, "read error");
  return content;
}

void FileStorage::write(const std::string &key, const std::string &bytes) {
  checkKey(key);
  const fs::path target = resolve(key);
  makeParentDirectories(key, target);

  std::lock_guard<std::mutex> guard(mutexFor(key));
  LockFile lock(key, target.string() + ".lock");

  const std::string tmp = stageTemporary(key, target, bytes);
  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    std::string msg = errnoMessage("rename failed");
    ::unlink(tmp.c_str());
    throwStorageFailure(key, msg);
  }

  Logger::getInstance().log(LogLevel::TRACE,
                            "Wrote " + std::to_string(bytes.size()) +
                                " bytes to " + target.string());
}

bool FileStorage::create(const std::string &key, const std::string &bytes) {
  checkKey(key);
  const fs::path target = resolve(key);
  makeParentDirectories(key, target);

  const std::string tmp = stageTemporary(key, target, bytes);
  int rc = ::link(tmp.c_str(), target.c_str());
  int linkErrno = errno;
  ::unlink(tmp.c_str());
  if (rc != 0) {
    if (linkErrno == EEXIST)
      return false;
    errno = linkErrno;
    throwStorageFailure(key, errnoMessage("link failed"));
  }

  Logger::getInstance().log(LogLevel::TRACE,
                            "Created " + target.string() + " (" +
                                std::to_string(bytes.size()) + " bytes)");
  return true;
}

std::vector<std::string> FileStorage::list(const std::string &prefix) {
  if (!prefix.empty())
    checkKey(prefix);
  const fs::path dir = prefix.empty() ? fs::path(root_) : fs::path(resolve(prefix));
  std::vector<std::string> names;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory)
      throwStorageFailure(prefix, ec.message());
    return names;
  }

  fs::directory_iterator it(dir, ec);
  if (ec)
    throwStorageFailure(prefix, "cannot list directory: " + ec.message());
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if (ec)
    throwStorageFailure(prefix, "cannot list directory: " + ec.message());
  return names;
}

} // namespace evichain

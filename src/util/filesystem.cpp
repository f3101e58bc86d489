#include "rem/util/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rem::util {

namespace {

std::string errnoMessage(int error = errno) {
  return std::strerror(error);
}

// Writes the whole buffer, retrying short writes and EINTR
bool writeAll(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t written = ::write(fd, data, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += written;
    size -= static_cast<size_t>(written);
  }
  return true;
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(std::filesystem::path target_path)
    : target_path_(std::move(target_path)) {}

AtomicFileWriter::~AtomicFileWriter() {
  if (written_ && !committed_) {
    removeTemp();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (written_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    auto created = FileSystem::createDirectories(parent);
    if (!created.has_value()) {
      return created;
    }
  }

  std::string pattern = target_path_.string() + ".tmp.XXXXXX";
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
        "Cannot create temporary file for " + target_path_.string() + ": " + errnoMessage()));
  }
  temp_path_ = name.data();
  written_ = true;

  // Keep the permissions of the file being replaced
  struct stat existing {};
  if (::stat(target_path_.c_str(), &existing) == 0) {
    ::fchmod(fd, existing.st_mode & 07777);
  } else {
    ::fchmod(fd, 0644);
  }

  bool ok = writeAll(fd, content.data(), content.size()) && ::fsync(fd) == 0;
  std::string failure = ok ? std::string() : errnoMessage();
  if (::close(fd) != 0 && ok) {
    ok = false;
    failure = errnoMessage();
  }

  if (!ok) {
    removeTemp();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
        "Failed to write " + temp_path_.string() + ": " + failure));
  }
  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (!written_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Nothing written"));
  }
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }

  if (::rename(temp_path_.c_str(), target_path_.c_str()) != 0) {
    int error = errno;
    auto message = errnoMessage(error);
    removeTemp();
    if (error == EACCES || error == EPERM) {
      return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
          "Cannot replace " + target_path_.string() + ": " + message));
    }
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
        "Cannot replace " + target_path_.string() + ": " + message));
  }
  committed_ = true;

  // The rename is only durable once the directory entry is synced
  auto parent = target_path_.parent_path();
  int dir_fd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd >= 0) {
    ::fsync(dir_fd);
    ::close(dir_fd);
  }

  return {};
}

void AtomicFileWriter::removeTemp() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto written = writer.write(content);
  if (!written.has_value()) {
    return written;
  }
  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    auto code = std::filesystem::exists(path) ? ErrorCode::kFilePermissionDenied
                                              : ErrorCode::kFileNotFound;
    return std::unexpected(makeError(code, "Cannot open file: " + path.string()));
  }

  std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }
  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
        "Cannot create directory " + path.string() + ": " + ec.message()));
  }
  return {};
}

bool FileSystem::isWritableDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return false;
  }
  return ::access(path.c_str(), W_OK | X_OK) == 0;
}

}  // namespace rem::util

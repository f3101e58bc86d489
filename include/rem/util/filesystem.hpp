#pragma once

#include <filesystem>
#include <string>

#include "rem/common.hpp"

namespace rem::util {

/**
 * @brief Replaces a file's contents all at once
 *
 * Content goes to a unique temporary file beside the target, which is synced
 * and renamed over the target by commit(). Readers see either the old or the
 * new file, never a partial one. An uncommitted temporary file is removed on
 * destruction.
 */
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(std::filesystem::path target_path);
  ~AtomicFileWriter();

  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  // Create the temporary file and write content to it; creates the parent directory
  Result<void> write(const std::string& content);

  // Sync and rename the temporary file over the target
  Result<void> commit();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool written_ = false;
  bool committed_ = false;

  void removeTemp();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  static Result<std::string> readFile(const std::filesystem::path& path);

  // Create directory tree; existing directories are left as they are
  static Result<void> createDirectories(const std::filesystem::path& path);

  // Check that the current user may create files in a directory
  static bool isWritableDirectory(const std::filesystem::path& path);
};

}  // namespace rem::util

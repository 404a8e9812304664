#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  checkAndRotate();

  file_ << record.formatted << '\n';
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotate() {
  std::lock_guard<std::mutex> lock(mutex_);
  rotateUnlocked();
}

// Rotation is checked on every write; the size check goes through the
// filesystem because the stream position is not reliable across processes
// appending to the same file.
void FileLogWriter::checkAndRotate() {
  if (!file_.is_open())
    return;

  file_.flush();
  std::error_code ec;
  auto fileSize = std::filesystem::file_size(fileName_, ec);
  if (!ec && fileSize >= maxFileSize_) {
    rotateUnlocked();
  }
}

// Shifts name.N -> name.N+1 (dropping the oldest), moves the live file to
// name.1 and reopens an empty live file.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string oldFile = fileName_ + "." + std::to_string(i);
    std::string newFile = fileName_ + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == maxBackupFiles_ - 1) {
        std::filesystem::remove(oldFile, ec);
      } else {
        std::filesystem::rename(oldFile, newFile, ec);
      }
    }
  }

  if (std::filesystem::exists(fileName_, ec)) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  }

  file_.open(fileName_, std::ios::app);
}

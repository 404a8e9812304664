#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  mutable std::mutex mutex_;

public:
  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = 10 * 1024 * 1024,
                         int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  void rotate();

  const std::string &fileName() const { return fileName_; }

private:
  void checkAndRotate();
  void rotateUnlocked();
};

#endif

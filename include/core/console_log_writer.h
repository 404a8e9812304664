#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <mutex>

// Writes rendered lines to stdout, or stderr for WARNING and above.
class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;
  bool open_ = true;

public:
  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif

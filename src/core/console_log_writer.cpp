#include "core/console_log_writer.h"
#include <iostream>

bool ConsoleLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
    return false;

  std::ostream &out = record.isError ? std::cerr : std::cout;
  out << record.formatted << '\n';
  return out.good();
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  std::cerr.flush();
}

void ConsoleLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  open_ = false;
}

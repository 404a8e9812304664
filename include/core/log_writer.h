#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// One log event, already filtered by level. `formatted` holds the rendered
// line for text sinks; structured sinks use the individual fields.
struct LogRecord {
  std::string timestamp;
  std::string level;
  std::string category;
  std::string component;
  std::string message;
  std::string formatted;
  bool isError = false;
};

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const LogRecord &record) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

#endif

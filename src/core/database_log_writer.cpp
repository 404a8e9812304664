#include "core/database_log_writer.h"
#include <iostream>

namespace {
constexpr size_t MAX_LEVEL_LENGTH = 50;
constexpr size_t MAX_COMPONENT_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

size_t utf8SequenceLength(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

// Drops bytes that would make PostgreSQL reject the row with an encoding
// error: stray continuation bytes, truncated sequences and control bytes.
std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    auto c = static_cast<unsigned char>(input[i]);

    if ((c >= 0x20 && c <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
      result += static_cast<char>(c);
      continue;
    }

    size_t len = utf8SequenceLength(c);
    if (len == 0 || i + len > input.size())
      continue;

    bool valid = true;
    for (size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(input[i + k]) & 0xC0) != 0x80) {
        valid = false;
        break;
      }
    }
    if (valid) {
      result.append(input, i, len);
      i += len - 1;
    }
  }

  return result;
}
} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString)
    : connectionString_(connectionString), statementPrepared_(false),
      enabled_(true) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    prepareStatementUnlocked();
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::prepareStatementUnlocked() {
  if (!conn_ || !conn_->is_open() || statementPrepared_)
    return;

  try {
    conn_->prepare("log_insert",
                   "INSERT INTO metadata.logs (ts, level, category, "
                   "component, message) VALUES (NOW(), $1, $2, $3, $4)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

// Oversized records are refused rather than truncated so that a runaway
// message cannot bloat the log table. A broken connection disables the
// writer permanently; the console and file sinks keep working.
bool DatabaseLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    if (conn_ && !conn_->is_open()) {
      enabled_ = false;
    }
    return false;
  }

  if (record.level.length() > MAX_LEVEL_LENGTH ||
      record.category.length() > MAX_LEVEL_LENGTH ||
      record.component.length() > MAX_COMPONENT_LENGTH ||
      record.message.length() > MAX_MESSAGE_LENGTH) {
    return false;
  }

  try {
    if (!statementPrepared_) {
      prepareStatementUnlocked();
      if (!statementPrepared_)
        return false;
    }

    pqxx::work txn(*conn_);
    txn.exec_prepared("log_insert", sanitizeUTF8(record.level),
                      sanitizeUTF8(record.category),
                      sanitizeUTF8(record.component),
                      sanitizeUTF8(record.message));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: SQL error writing log entry: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

void DatabaseLogWriter::disable() {
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = false;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}

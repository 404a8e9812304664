#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Persists log records into metadata.logs on a dedicated connection, outside
// the replication pool. The table is created by the schema bootstrap; until
// it exists, preparation fails and the writer stays disabled.
class DatabaseLogWriter : public ILogWriter {
private:
  std::unique_ptr<pqxx::connection> conn_;
  std::string connectionString_;
  bool statementPrepared_;
  bool enabled_;
  mutable std::mutex mutex_;

public:
  explicit DatabaseLogWriter(const std::string &connectionString);
  ~DatabaseLogWriter() override { close(); }

  DatabaseLogWriter(const DatabaseLogWriter &) = delete;
  DatabaseLogWriter &operator=(const DatabaseLogWriter &) = delete;

  bool write(const LogRecord &record) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;
  bool isEnabled() const;
  void disable();

private:
  void prepareStatementUnlocked();
};

#endif

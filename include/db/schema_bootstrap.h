#ifndef SCHEMA_BOOTSTRAP_H
#define SCHEMA_BOOTSTRAP_H

#include "db/connection_pool.h"
#include <string>
#include <vector>

// One schema object and the DDL that creates it. references lists the
// definitions (schemas, parent tables, base tables of a view) that must
// exist first.
struct TableDefinition {
  std::string name;
  std::vector<std::string> statements;
  std::vector<std::string> references;
};

// Creates the replica's schemas, tables, indexes and views before any event
// is applied. Safe to run on every start: "already exists" errors are
// tolerated, any other failure aborts with SchemaBootstrapError.
class SchemaBootstrap {
public:
  explicit SchemaBootstrap(ConnectionPool &pool);
  SchemaBootstrap(ConnectionPool &pool, std::vector<TableDefinition> definitions);

  static std::vector<TableDefinition> defaultDefinitions();

  // Throws SchemaBootstrapError when a definition references one that is
  // defined later or not at all, or when two definitions share a name.
  static void validateOrdering(const std::vector<TableDefinition> &definitions);

  static bool isAlreadyExists(const std::string &sqlstate);

  void run();

  size_t executedStatements() const { return executed_; }
  size_t toleratedStatements() const { return tolerated_; }

private:
  ConnectionPool &pool_;
  std::vector<TableDefinition> definitions_;
  size_t executed_ = 0;
  size_t tolerated_ = 0;
};

#endif

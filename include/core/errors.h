#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Raw message bytes are not a usable envelope: not JSON, not an object, or
// missing event_type / entity_id.
class EnvelopeDecodeError : public std::runtime_error {
public:
  explicit EnvelopeDecodeError(const std::string &what)
      : std::runtime_error(what) {}
};

// A payload lacks a field the producer contract promises, or carries a value
// of the wrong shape (including an unparseable timestamp).
class PayloadFieldError : public std::runtime_error {
public:
  PayloadFieldError(const std::string &field, const std::string &what)
      : std::runtime_error(field + ": " + what), field_(field) {}

  const std::string &field() const { return field_; }

private:
  std::string field_;
};

class SchemaBootstrapError : public std::runtime_error {
public:
  SchemaBootstrapError(const std::string &table, const std::string &what)
      : std::runtime_error("Schema bootstrap failed on " + table + ": " + what),
        table_(table) {}

  const std::string &table() const { return table_; }

private:
  std::string table_;
};

class ConnectionPoolError : public std::runtime_error {
public:
  explicit ConnectionPoolError(const std::string &what)
      : std::runtime_error(what) {}
};

class KafkaError : public std::runtime_error {
public:
  explicit KafkaError(const std::string &what) : std::runtime_error(what) {}
};

#endif

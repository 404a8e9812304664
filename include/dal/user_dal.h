#ifndef USER_DAL_H
#define USER_DAL_H

#include "dal/row_types.h"
#include "db/connection_pool.h"
#include <optional>
#include <string>

class IUserDAL {
public:
  virtual ~IUserDAL() = default;

  // Insert or overwrite every column except user_id and created_at.
  virtual void upsertUser(const UserRow &row) = 0;

  // Sets deleted_at once; a replayed delete keeps the first value.
  virtual void softDeleteUser(const std::string &userId,
                              const EventBookkeeping &event) = 0;

  virtual std::optional<UserRow> findUser(const std::string &userId) = 0;
  virtual size_t countActiveUsers() = 0;
};

class UserDAL : public IUserDAL {
public:
  explicit UserDAL(ConnectionPool &pool) : pool_(pool) {}

  void upsertUser(const UserRow &row) override;
  void softDeleteUser(const std::string &userId,
                      const EventBookkeeping &event) override;
  std::optional<UserRow> findUser(const std::string &userId) override;
  size_t countActiveUsers() override;

private:
  ConnectionPool &pool_;
};

#endif

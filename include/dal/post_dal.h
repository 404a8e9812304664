#ifndef POST_DAL_H
#define POST_DAL_H

#include "dal/row_types.h"
#include "db/connection_pool.h"
#include <optional>
#include <string>

class IPostDAL {
public:
  virtual ~IPostDAL() = default;

  virtual void upsertPost(const PostRow &row) = 0;

  // Same contract as users: deleted_at is written once and kept on replay.
  virtual void softDeletePost(const std::string &postId,
                              const EventBookkeeping &event) = 0;

  virtual std::optional<PostRow> findPost(const std::string &postId) = 0;
  virtual size_t countActivePosts() = 0;
};

class PostDAL : public IPostDAL {
public:
  explicit PostDAL(ConnectionPool &pool) : pool_(pool) {}

  void upsertPost(const PostRow &row) override;
  void softDeletePost(const std::string &postId,
                      const EventBookkeeping &event) override;
  std::optional<PostRow> findPost(const std::string &postId) override;
  size_t countActivePosts() override;

private:
  ConnectionPool &pool_;
};

#endif

#ifndef RECORDING_DALS_H
#define RECORDING_DALS_H

#include "dal/order_dal.h"
#include "dal/post_dal.h"
#include "dal/product_dal.h"
#include "dal/supplier_dal.h"
#include "dal/user_dal.h"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory DAL doubles. They record every call in order ("calls") and keep
// just enough state to answer the find/count methods.

class RecordingUserDAL : public IUserDAL {
public:
  std::vector<std::string> calls;
  std::map<std::string, UserRow> rows;
  bool failWrites = false;

  void upsertUser(const UserRow &row) override {
    if (failWrites)
      throw std::runtime_error("users unavailable");
    calls.push_back("upsertUser:" + row.userId);
    auto it = rows.find(row.userId);
    UserRow stored = row;
    if (it != rows.end())
      stored.createdAt = it->second.createdAt;
    rows[row.userId] = stored;
  }
  void softDeleteUser(const std::string &userId,
                      const EventBookkeeping &event) override {
    calls.push_back("softDeleteUser:" + userId);
    auto it = rows.find(userId);
    if (it == rows.end())
      return;
    if (!it->second.deletedAt)
      it->second.deletedAt = event.eventTimestamp
                                 ? event.eventTimestamp
                                 : TimeUtils::OptionalTimestamp(
                                       TimeUtils::nowUtc());
    it->second.event = event;
  }
  std::optional<UserRow> findUser(const std::string &userId) override {
    auto it = rows.find(userId);
    if (it == rows.end())
      return std::nullopt;
    return it->second;
  }
  size_t countActiveUsers() override {
    size_t n = 0;
    for (const auto &entry : rows)
      n += entry.second.deletedAt ? 0 : 1;
    return n;
  }
};

class RecordingSupplierDAL : public ISupplierDAL {
public:
  std::vector<std::string> calls;
  std::map<std::string, SupplierRow> rows;

  void upsertSupplier(const SupplierRow &row) override {
    calls.push_back("upsertSupplier:" + row.supplierId);
    rows[row.supplierId] = row;
  }
  void deleteSupplier(const std::string &supplierId) override {
    calls.push_back("deleteSupplier:" + supplierId);
    rows.erase(supplierId);
  }
  std::optional<SupplierRow>
  findSupplier(const std::string &supplierId) override {
    auto it = rows.find(supplierId);
    if (it == rows.end())
      return std::nullopt;
    return it->second;
  }
};

class RecordingProductDAL : public IProductDAL {
public:
  std::vector<std::string> calls;
  std::map<std::string, ProductRow> rows;
  std::map<std::string, std::vector<ProductVariantRow>> variants;

  void upsertProduct(const ProductRow &row) override {
    calls.push_back("upsertProduct:" + row.productId);
    rows[row.productId] = row;
  }
  void replaceVariants(const std::string &productId,
                       const std::vector<ProductVariantRow> &set) override {
    calls.push_back("replaceVariants:" + productId + ":" +
                    std::to_string(set.size()));
    variants[productId] = set;
  }
  void deleteProduct(const std::string &productId) override {
    calls.push_back("deleteProduct:" + productId);
    rows.erase(productId);
    variants.erase(productId);
  }
  std::optional<ProductRow> findProduct(const std::string &productId) override {
    auto it = rows.find(productId);
    if (it == rows.end())
      return std::nullopt;
    return it->second;
  }
  std::vector<ProductVariantRow>
  listVariants(const std::string &productId) override {
    auto it = variants.find(productId);
    if (it == variants.end())
      return {};
    return it->second;
  }
};

class RecordingOrderDAL : public IOrderDAL {
public:
  std::vector<std::string> calls;
  std::map<std::string, OrderRow> rows;
  std::map<std::string, std::vector<OrderItemRow>> items;
  std::vector<EventBookkeeping> cancellations;

  void upsertOrder(const OrderRow &row) override {
    calls.push_back("upsertOrder:" + row.orderId);
    rows[row.orderId] = row;
  }
  void upsertOrderItems(const std::string &orderId,
                        const std::vector<OrderItemRow> &set,
                        const EventBookkeeping &) override {
    calls.push_back("upsertOrderItems:" + orderId + ":" +
                    std::to_string(set.size()));
    items[orderId] = set;
  }
  bool cancelOrder(const std::string &orderNumber,
                   const EventBookkeeping &event) override {
    calls.push_back("cancelOrder:" + orderNumber);
    cancellations.push_back(event);
    for (auto &entry : rows) {
      if (entry.second.orderNumber == orderNumber) {
        entry.second.status = "cancelled";
        return true;
      }
    }
    return false;
  }
  std::optional<OrderRow> findOrder(const std::string &orderId) override {
    auto it = rows.find(orderId);
    if (it == rows.end())
      return std::nullopt;
    return it->second;
  }
  std::vector<OrderItemRow> findOrderItems(const std::string &orderId) override {
    auto it = items.find(orderId);
    if (it == items.end())
      return {};
    return it->second;
  }
};

class RecordingPostDAL : public IPostDAL {
public:
  std::vector<std::string> calls;
  std::map<std::string, PostRow> rows;

  void upsertPost(const PostRow &row) override {
    calls.push_back("upsertPost:" + row.postId);
    rows[row.postId] = row;
  }
  void softDeletePost(const std::string &postId,
                      const EventBookkeeping &event) override {
    calls.push_back("softDeletePost:" + postId);
    auto it = rows.find(postId);
    if (it != rows.end() && !it->second.deletedAt)
      it->second.deletedAt = event.eventTimestamp;
  }
  std::optional<PostRow> findPost(const std::string &postId) override {
    auto it = rows.find(postId);
    if (it == rows.end())
      return std::nullopt;
    return it->second;
  }
  size_t countActivePosts() override {
    size_t n = 0;
    for (const auto &entry : rows)
      n += entry.second.deletedAt ? 0 : 1;
    return n;
  }
};

#endif

#ifndef ORDER_DAL_H
#define ORDER_DAL_H

#include "dal/row_types.h"
#include "db/connection_pool.h"
#include <optional>
#include <string>
#include <vector>

// Orders are written with selective upserts: a conflicting row only takes
// the lifecycle columns (status, fulfillment, bookkeeping), never the
// customer, shipping or product snapshots. Every conflicting write is also
// skipped when the stored row was produced by a newer event, so replaying an
// old event cannot move an order backwards.
class IOrderDAL {
public:
  virtual ~IOrderDAL() = default;

  virtual void upsertOrder(const OrderRow &row) = 0;
  virtual void upsertOrderItems(const std::string &orderId,
                                const std::vector<OrderItemRow> &items,
                                const EventBookkeeping &event) = 0;

  // Returns false when no order carries that number.
  virtual bool cancelOrder(const std::string &orderNumber,
                           const EventBookkeeping &event) = 0;

  virtual std::optional<OrderRow> findOrder(const std::string &orderId) = 0;
  virtual std::vector<OrderItemRow>
  findOrderItems(const std::string &orderId) = 0;
};

class OrderDAL : public IOrderDAL {
public:
  explicit OrderDAL(ConnectionPool &pool) : pool_(pool) {}

  void upsertOrder(const OrderRow &row) override;
  void upsertOrderItems(const std::string &orderId,
                        const std::vector<OrderItemRow> &items,
                        const EventBookkeeping &event) override;
  bool cancelOrder(const std::string &orderNumber,
                   const EventBookkeeping &event) override;
  std::optional<OrderRow> findOrder(const std::string &orderId) override;
  std::vector<OrderItemRow> findOrderItems(const std::string &orderId) override;

  // Operator helper; items follow through the foreign key.
  void deleteOrder(const std::string &orderId);

private:
  ConnectionPool &pool_;
};

#endif

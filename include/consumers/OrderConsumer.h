#ifndef ORDER_CONSUMER_H
#define ORDER_CONSUMER_H

#include "consumers/IDomainConsumer.h"
#include "dal/order_dal.h"
#include <vector>

struct FlattenedOrder {
  OrderRow order;
  std::vector<OrderItemRow> items;
};

class OrderConsumer : public IDomainConsumer {
public:
  explicit OrderConsumer(IOrderDAL &dal) : dal_(dal) {}

  Domain getDomain() const override { return Domain::ORDER; }
  std::map<EventKind, EventHandler> getHandlers() override;

  static FlattenedOrder flatten(const EventEnvelope &event);
  static OrderItemRow flattenItem(const json &item, size_t index);

private:
  void handleCreated(const EventEnvelope &event);
  void handleCancelled(const EventEnvelope &event);

  IOrderDAL &dal_;
};

#endif

#ifndef SUPPLIER_CONSUMER_H
#define SUPPLIER_CONSUMER_H

#include "consumers/IDomainConsumer.h"
#include "dal/supplier_dal.h"

class SupplierConsumer : public IDomainConsumer {
public:
  explicit SupplierConsumer(ISupplierDAL &dal) : dal_(dal) {}

  Domain getDomain() const override { return Domain::SUPPLIER; }
  std::map<EventKind, EventHandler> getHandlers() override;

  // contact_info, company_info (with the nested business_address) and
  // business_info collapse into one wide row.
  static SupplierRow flatten(const EventEnvelope &event);

private:
  void handleUpsert(EventKind kind, const EventEnvelope &event);
  void handleDeleted(const EventEnvelope &event);

  ISupplierDAL &dal_;
};

#endif

#ifndef USER_CONSUMER_H
#define USER_CONSUMER_H

#include "consumers/IDomainConsumer.h"
#include "dal/user_dal.h"

class UserConsumer : public IDomainConsumer {
public:
  explicit UserConsumer(IUserDAL &dal) : dal_(dal) {}

  Domain getDomain() const override { return Domain::USER; }
  std::map<EventKind, EventHandler> getHandlers() override;

  static UserRow flatten(const EventEnvelope &event);

private:
  void handleUpsert(EventKind kind, const EventEnvelope &event);
  void handleDeleted(const EventEnvelope &event);

  IUserDAL &dal_;
};

#endif

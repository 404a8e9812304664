#ifndef POST_CONSUMER_H
#define POST_CONSUMER_H

#include "consumers/IDomainConsumer.h"
#include "dal/post_dal.h"

class PostConsumer : public IDomainConsumer {
public:
  explicit PostConsumer(IPostDAL &dal) : dal_(dal) {}

  Domain getDomain() const override { return Domain::POST; }
  std::map<EventKind, EventHandler> getHandlers() override;

  // media is stored as a JSON blob; an empty list leaves the column NULL.
  static PostRow flatten(const EventEnvelope &event);

private:
  void handleUpsert(EventKind kind, const EventEnvelope &event);
  void handleDeleted(const EventEnvelope &event);

  IPostDAL &dal_;
};

#endif

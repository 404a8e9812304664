#ifndef HANDLER_REGISTRY_H
#define HANDLER_REGISTRY_H

#include "consumers/IDomainConsumer.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

// Dispatch table keyed by (topic, kind). Built once at startup, read-only
// afterwards.
class HandlerRegistry {
public:
  // Throws std::invalid_argument when the consumer's domain is already
  // registered or when it returns a handler for a kind of another domain.
  void registerConsumer(IDomainConsumer &consumer);

  // nullptr when nothing handles that kind on that topic.
  const EventHandler *find(const std::string &topic, EventKind kind) const;

  // Topics of the registered domains, in registration order.
  std::vector<std::string> topics() const;

  bool hasDomain(Domain domain) const;
  size_t size() const { return handlers_.size(); }

private:
  std::map<std::pair<std::string, EventKind>, EventHandler> handlers_;
  std::vector<Domain> domains_;
};

#endif

#include "sync/HandlerRegistry.h"
#include "core/logger.h"
#include <algorithm>
#include <stdexcept>

void HandlerRegistry::registerConsumer(IDomainConsumer &consumer) {
  const Domain domain = consumer.getDomain();
  const std::string domainName = TopicRouter::domainName(domain);
  if (hasDomain(domain)) {
    throw std::invalid_argument("Domain registered twice: " + domainName);
  }

  auto handlers = consumer.getHandlers();
  for (const auto &entry : handlers) {
    if (TopicRouter::domainOf(entry.first) != domain) {
      throw std::invalid_argument(
          "Consumer for " + domainName + " returned a handler for " +
          TopicRouter::eventTypeName(entry.first));
    }
  }

  const std::string topic = TopicRouter::topicFor(domain);
  for (auto &entry : handlers) {
    handlers_[{topic, entry.first}] = std::move(entry.second);
  }
  domains_.push_back(domain);

  size_t expected = TopicRouter::kindsOf(domain).size();
  if (handlers.size() < expected) {
    Logger::warning(LogCategory::DISPATCH, "HandlerRegistry",
                    domainName + " consumer handles " +
                        std::to_string(handlers.size()) + " of " +
                        std::to_string(expected) + " event kinds");
  }
  Logger::info(LogCategory::DISPATCH, "HandlerRegistry",
               "Registered " + std::to_string(handlers.size()) +
                   " handlers for topic " + topic);
}

const EventHandler *HandlerRegistry::find(const std::string &topic,
                                          EventKind kind) const {
  auto it = handlers_.find({topic, kind});
  if (it == handlers_.end())
    return nullptr;
  return &it->second;
}

std::vector<std::string> HandlerRegistry::topics() const {
  std::vector<std::string> result;
  for (Domain domain : domains_)
    result.push_back(TopicRouter::topicFor(domain));
  return result;
}

bool HandlerRegistry::hasDomain(Domain domain) const {
  return std::find(domains_.begin(), domains_.end(), domain) != domains_.end();
}

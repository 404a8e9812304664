#ifndef TOPIC_ROUTER_H
#define TOPIC_ROUTER_H

#include "events/event_kind.h"
#include <optional>
#include <string>
#include <vector>

// Static routing tables between domains, topic names and event kinds. One
// topic per domain; the event type string is "<domain>.<action>".
class TopicRouter {
public:
  static std::string topicFor(Domain domain);
  static std::string topicFor(EventKind kind);
  static std::optional<Domain> domainForTopic(const std::string &topic);

  static Domain domainOf(EventKind kind);
  static PayloadShape payloadShapeOf(EventKind kind);

  static std::string eventTypeName(EventKind kind);
  static std::optional<EventKind> parseEventType(const std::string &eventType);

  // Upper-case label used in handler trace lines, e.g. "USER_CREATED".
  static std::string traceLabel(EventKind kind);

  static std::string domainName(Domain domain);
  static std::optional<Domain> parseDomain(const std::string &name);

  static const std::vector<Domain> &allDomains();
  static const std::vector<EventKind> &kindsOf(Domain domain);
  static std::vector<std::string> allTopics();

  static bool belongsToTopic(EventKind kind, const std::string &topic);

  // Parses a comma separated list such as "user, product". Empty input
  // selects every domain. Unknown names and duplicates throw
  // std::invalid_argument.
  static std::vector<Domain> parseDomainList(const std::string &list);

  // Name of the id field in the minimal delete payload, e.g. "user_id".
  static std::string idFieldOf(Domain domain);
};

#endif

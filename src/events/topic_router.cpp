#include "events/topic_router.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace {

struct KindEntry {
  EventKind kind;
  const char *typeName;
  Domain domain;
  PayloadShape shape;
};

const KindEntry kKindTable[] = {
    {EventKind::USER_CREATED, "user.created", Domain::USER,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::USER_UPDATED, "user.updated", Domain::USER,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::USER_DELETED, "user.deleted", Domain::USER,
     PayloadShape::ENTITY_REF},

    {EventKind::SUPPLIER_CREATED, "supplier.created", Domain::SUPPLIER,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::SUPPLIER_UPDATED, "supplier.updated", Domain::SUPPLIER,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::SUPPLIER_DELETED, "supplier.deleted", Domain::SUPPLIER,
     PayloadShape::ENTITY_REF},

    {EventKind::PRODUCT_CREATED, "product.created", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_UPDATED, "product.updated", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_PUBLISHED, "product.published", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_DISCONTINUED, "product.discontinued", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_OUT_OF_STOCK, "product.out_of_stock", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_RESTORED, "product.restored", Domain::PRODUCT,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::PRODUCT_DELETED, "product.deleted", Domain::PRODUCT,
     PayloadShape::ENTITY_REF},

    {EventKind::ORDER_CREATED, "order.created", Domain::ORDER,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::ORDER_CANCELLED, "order.cancelled", Domain::ORDER,
     PayloadShape::ORDER_NUMBER_REF},

    {EventKind::POST_CREATED, "post.created", Domain::POST,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::POST_UPDATED, "post.updated", Domain::POST,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::POST_PUBLISHED, "post.published", Domain::POST,
     PayloadShape::FULL_SNAPSHOT},
    {EventKind::POST_DELETED, "post.deleted", Domain::POST,
     PayloadShape::ENTITY_REF},
};

const KindEntry &entryFor(EventKind kind) {
  for (const auto &entry : kKindTable) {
    if (entry.kind == kind)
      return entry;
  }
  throw std::logic_error("EventKind missing from routing table: " +
                         std::to_string(static_cast<int>(kind)));
}

} // namespace

std::string TopicRouter::domainName(Domain domain) {
  switch (domain) {
  case Domain::USER:
    return "user";
  case Domain::SUPPLIER:
    return "supplier";
  case Domain::PRODUCT:
    return "product";
  case Domain::ORDER:
    return "order";
  case Domain::POST:
    return "post";
  }
  throw std::logic_error("Unknown domain");
}

std::optional<Domain> TopicRouter::parseDomain(const std::string &name) {
  std::string lowered = StringUtils::toLower(StringUtils::trim(name));
  for (Domain domain : allDomains()) {
    if (domainName(domain) == lowered)
      return domain;
  }
  return std::nullopt;
}

// Topic names equal the domain names.
std::string TopicRouter::topicFor(Domain domain) { return domainName(domain); }

std::string TopicRouter::topicFor(EventKind kind) {
  return topicFor(domainOf(kind));
}

std::optional<Domain> TopicRouter::domainForTopic(const std::string &topic) {
  for (Domain domain : allDomains()) {
    if (topicFor(domain) == topic)
      return domain;
  }
  return std::nullopt;
}

Domain TopicRouter::domainOf(EventKind kind) { return entryFor(kind).domain; }

PayloadShape TopicRouter::payloadShapeOf(EventKind kind) {
  return entryFor(kind).shape;
}

std::string TopicRouter::eventTypeName(EventKind kind) {
  return entryFor(kind).typeName;
}

std::string TopicRouter::traceLabel(EventKind kind) {
  std::string label = entryFor(kind).typeName;
  for (auto &c : label)
    c = (c == '.') ? '_' : static_cast<char>(std::toupper(
                               static_cast<unsigned char>(c)));
  return label;
}

std::optional<EventKind>
TopicRouter::parseEventType(const std::string &eventType) {
  for (const auto &entry : kKindTable) {
    if (eventType == entry.typeName)
      return entry.kind;
  }
  return std::nullopt;
}

const std::vector<Domain> &TopicRouter::allDomains() {
  static const std::vector<Domain> domains = {Domain::USER, Domain::ORDER,
                                              Domain::POST, Domain::PRODUCT,
                                              Domain::SUPPLIER};
  return domains;
}

const std::vector<EventKind> &TopicRouter::kindsOf(Domain domain) {
  static const std::map<Domain, std::vector<EventKind>> byDomain = [] {
    std::map<Domain, std::vector<EventKind>> m;
    for (const auto &entry : kKindTable)
      m[entry.domain].push_back(entry.kind);
    return m;
  }();
  return byDomain.at(domain);
}

std::vector<std::string> TopicRouter::allTopics() {
  std::vector<std::string> topics;
  for (Domain domain : allDomains())
    topics.push_back(topicFor(domain));
  return topics;
}

bool TopicRouter::belongsToTopic(EventKind kind, const std::string &topic) {
  return topicFor(kind) == topic;
}

std::vector<Domain> TopicRouter::parseDomainList(const std::string &list) {
  std::vector<std::string> names = StringUtils::splitTrimmed(list, ',');
  if (names.empty())
    return allDomains();

  std::vector<Domain> domains;
  for (const auto &name : names) {
    auto domain = parseDomain(name);
    if (!domain)
      throw std::invalid_argument("Unknown domain: " + name);
    if (std::find(domains.begin(), domains.end(), *domain) != domains.end())
      throw std::invalid_argument("Domain listed twice: " + name);
    domains.push_back(*domain);
  }
  return domains;
}

std::string TopicRouter::idFieldOf(Domain domain) {
  return domainName(domain) + "_id";
}

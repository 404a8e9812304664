#include "consumers/UserConsumer.h"
#include "core/logger.h"

using namespace JsonUtils;

std::map<EventKind, EventHandler> UserConsumer::getHandlers() {
  std::map<EventKind, EventHandler> handlers;
  for (EventKind kind : TopicRouter::kindsOf(Domain::USER)) {
    switch (kind) {
    case EventKind::USER_CREATED:
    case EventKind::USER_UPDATED:
      handlers[kind] = [this, kind](const EventEnvelope &event) {
        handleUpsert(kind, event);
      };
      break;
    case EventKind::USER_DELETED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleDeleted(event);
      };
      break;
    case EventKind::SUPPLIER_CREATED:
    case EventKind::SUPPLIER_UPDATED:
    case EventKind::SUPPLIER_DELETED:
    case EventKind::PRODUCT_CREATED:
    case EventKind::PRODUCT_UPDATED:
    case EventKind::PRODUCT_PUBLISHED:
    case EventKind::PRODUCT_DISCONTINUED:
    case EventKind::PRODUCT_OUT_OF_STOCK:
    case EventKind::PRODUCT_RESTORED:
    case EventKind::PRODUCT_DELETED:
    case EventKind::ORDER_CREATED:
    case EventKind::ORDER_CANCELLED:
    case EventKind::POST_CREATED:
    case EventKind::POST_UPDATED:
    case EventKind::POST_PUBLISHED:
    case EventKind::POST_DELETED:
      break;
    }
  }
  return handlers;
}

UserRow UserConsumer::flatten(const EventEnvelope &event) {
  const json &data = event.data();
  const json &contact = object(data, "contact_info");
  const json &profile = object(data, "profile");

  UserRow row;
  row.userId = event.entityId();
  row.email = requireString(contact, "primary_email", "contact_info");
  row.phone = string(contact, "phone");
  row.displayName = requireString(profile, "display_name", "profile");
  row.avatar = string(profile, "avatar");
  row.bio = string(profile, "bio");
  row.version = integer(data, "version").value_or(1);
  row.deletedAt = timestamp(data, "deleted_at");
  row.createdAt = requireTimestamp(data, "created_at");
  row.updatedAt = requireTimestamp(data, "updated_at");
  row.event = bookkeepingOf(event);
  return row;
}

void UserConsumer::handleUpsert(EventKind kind, const EventEnvelope &event) {
  dal_.upsertUser(flatten(event));
  Logger::info(LogCategory::HANDLER, "UserConsumer",
               "[" + TopicRouter::traceLabel(kind) + "] " + event.entityId());
}

void UserConsumer::handleDeleted(const EventEnvelope &event) {
  std::string userId = deletedEntityId(event, Domain::USER);
  dal_.softDeleteUser(userId, bookkeepingOf(event));
  Logger::info(LogCategory::HANDLER, "UserConsumer",
               "[USER_DELETED] " + userId);
}

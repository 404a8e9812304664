#include "consumers/SupplierConsumer.h"
#include "core/logger.h"

using namespace JsonUtils;

std::map<EventKind, EventHandler> SupplierConsumer::getHandlers() {
  std::map<EventKind, EventHandler> handlers;
  for (EventKind kind : TopicRouter::kindsOf(Domain::SUPPLIER)) {
    switch (kind) {
    case EventKind::SUPPLIER_CREATED:
    case EventKind::SUPPLIER_UPDATED:
      handlers[kind] = [this, kind](const EventEnvelope &event) {
        handleUpsert(kind, event);
      };
      break;
    case EventKind::SUPPLIER_DELETED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleDeleted(event);
      };
      break;
    case EventKind::USER_CREATED:
    case EventKind::USER_UPDATED:
    case EventKind::USER_DELETED:
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

SupplierRow SupplierConsumer::flatten(const EventEnvelope &event) {
  const json &data = event.data();
  const json &contact = object(data, "contact_info");
  const json &company = object(data, "company_info");
  const json &address = object(company, "business_address");
  const json &business = object(data, "business_info");

  SupplierRow row;
  row.supplierId = event.entityId();

  row.email = requireString(contact, "primary_email", "contact_info");
  row.primaryPhone = requireString(contact, "primary_phone", "contact_info");
  row.contactPersonName = string(contact, "contact_person_name");
  row.contactPersonTitle = string(contact, "contact_person_title");
  row.contactPersonEmail = string(contact, "contact_person_email");
  row.contactPersonPhone = string(contact, "contact_person_phone");

  row.legalName = requireString(company, "legal_name", "company_info");
  row.dbaName = string(company, "dba_name");
  row.streetAddress1 = string(address, "street_address_1");
  row.streetAddress2 = string(address, "street_address_2");
  row.city = string(address, "city");
  row.state = string(address, "state");
  row.zipCode = string(address, "zip_code");
  row.country = string(address, "country");

  row.supportEmail = string(business, "support_email");
  row.supportPhone = string(business, "support_phone");
  row.facebookUrl = string(business, "facebook_url");
  row.instagramHandle = string(business, "instagram_handle");
  row.twitterHandle = string(business, "twitter_handle");
  row.linkedinUrl = string(business, "linkedin_url");
  row.timezone = string(business, "timezone");

  row.createdAt = requireTimestamp(data, "created_at");
  row.updatedAt = requireTimestamp(data, "updated_at");
  row.event = bookkeepingOf(event);
  return row;
}

void SupplierConsumer::handleUpsert(EventKind kind,
                                    const EventEnvelope &event) {
  dal_.upsertSupplier(flatten(event));
  Logger::info(LogCategory::HANDLER, "SupplierConsumer",
               "[" + TopicRouter::traceLabel(kind) + "] " + event.entityId());
}

void SupplierConsumer::handleDeleted(const EventEnvelope &event) {
  std::string supplierId = deletedEntityId(event, Domain::SUPPLIER);
  dal_.deleteSupplier(supplierId);
  Logger::info(LogCategory::HANDLER, "SupplierConsumer",
               "[SUPPLIER_DELETED] " + supplierId);
}

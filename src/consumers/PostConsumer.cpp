#include "consumers/PostConsumer.h"
#include "core/logger.h"

using namespace JsonUtils;

std::map<EventKind, EventHandler> PostConsumer::getHandlers() {
  std::map<EventKind, EventHandler> handlers;
  for (EventKind kind : TopicRouter::kindsOf(Domain::POST)) {
    switch (kind) {
    case EventKind::POST_CREATED:
    case EventKind::POST_UPDATED:
    case EventKind::POST_PUBLISHED:
      handlers[kind] = [this, kind](const EventEnvelope &event) {
        handleUpsert(kind, event);
      };
      break;
    case EventKind::POST_DELETED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleDeleted(event);
      };
      break;
    case EventKind::USER_CREATED:
    case EventKind::USER_UPDATED:
    case EventKind::USER_DELETED:
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
      break;
    }
  }
  return handlers;
}

PostRow PostConsumer::flatten(const EventEnvelope &event) {
  const json &data = event.data();
  const json &author = object(data, "author");
  const json &link = object(data, "link_preview");
  const json &stats = object(data, "stats");
  const json &media = array(data, "media");

  PostRow row;
  row.postId = event.entityId();
  row.postType = requireString(data, "post_type");
  row.authorUserId = requireString(author, "user_id", "author");
  row.authorDisplayName = string(author, "display_name");
  row.authorAvatar = string(author, "avatar");
  row.authorType = string(author, "author_type");
  row.textContent = string(data, "text_content");
  if (!media.empty())
    row.mediaJson = media.dump();

  row.linkUrl = string(link, "url");
  row.linkTitle = string(link, "title");
  row.linkDescription = string(link, "description");
  row.linkImage = string(link, "image");
  row.linkSiteName = string(link, "site_name");

  row.viewCount = integer(stats, "view_count").value_or(0);
  row.likeCount = integer(stats, "like_count").value_or(0);
  row.commentCount = integer(stats, "comment_count").value_or(0);
  row.shareCount = integer(stats, "share_count").value_or(0);
  row.saveCount = integer(stats, "save_count").value_or(0);
  row.engagementRate = number(stats, "engagement_rate").value_or(0.0);
  row.lastCommentAt = timestamp(stats, "last_comment_at");

  row.deletedAt = timestamp(data, "deleted_at");
  row.publishedAt = timestamp(data, "published_at");
  row.createdAt = requireTimestamp(data, "created_at");
  row.updatedAt = requireTimestamp(data, "updated_at");
  row.event = bookkeepingOf(event);
  return row;
}

void PostConsumer::handleUpsert(EventKind kind, const EventEnvelope &event) {
  dal_.upsertPost(flatten(event));
  Logger::info(LogCategory::HANDLER, "PostConsumer",
               "[" + TopicRouter::traceLabel(kind) + "] " + event.entityId());
}

void PostConsumer::handleDeleted(const EventEnvelope &event) {
  std::string postId = deletedEntityId(event, Domain::POST);
  dal_.softDeletePost(postId, bookkeepingOf(event));
  Logger::info(LogCategory::HANDLER, "PostConsumer",
               "[POST_DELETED] " + postId);
}

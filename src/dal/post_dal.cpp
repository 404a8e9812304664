#include "dal/post_dal.h"
#include "core/logger.h"
#include "dal/dal_support.h"

using namespace DalSupport;

void PostDAL::upsertPost(const PostRow &row) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(row.postId);
    p.append(row.postType);
    p.append(row.authorUserId);
    p.append(row.authorDisplayName);
    p.append(row.authorAvatar);
    p.append(row.authorType);
    p.append(row.textContent);
    p.append(row.mediaJson);
    p.append(row.linkUrl);
    p.append(row.linkTitle);
    p.append(row.linkDescription);
    p.append(row.linkImage);
    p.append(row.linkSiteName);
    p.append(row.viewCount);
    p.append(row.likeCount);
    p.append(row.commentCount);
    p.append(row.shareCount);
    p.append(row.saveCount);
    p.append(row.engagementRate);
    p.append(toSql(row.lastCommentAt));
    p.append(toSql(row.deletedAt));
    p.append(toSql(row.publishedAt));
    p.append(toSql(row.createdAt));
    p.append(toSql(row.updatedAt));
    appendBookkeeping(p, row.event);

    txn.exec(
        pqxx::zview(
            "INSERT INTO analytics.posts (post_id, post_type, author_user_id, "
            "author_display_name, author_avatar, author_type, text_content, "
            "media_json, link_url, link_title, link_description, link_image, "
            "link_site_name, view_count, like_count, comment_count, "
            "share_count, save_count, engagement_rate, last_comment_at, "
            "deleted_at, published_at, created_at, updated_at, event_id, "
            "event_timestamp) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::jsonb, $9, $10, $11, $12, "
            "$13, $14, $15, $16, $17, $18, $19, $20::timestamptz, "
            "$21::timestamptz, $22::timestamptz, $23::timestamptz, "
            "$24::timestamptz, $25, $26::timestamptz) "
            "ON CONFLICT (post_id) DO UPDATE SET "
            "post_type = EXCLUDED.post_type, "
            "author_user_id = EXCLUDED.author_user_id, "
            "author_display_name = EXCLUDED.author_display_name, "
            "author_avatar = EXCLUDED.author_avatar, "
            "author_type = EXCLUDED.author_type, "
            "text_content = EXCLUDED.text_content, "
            "media_json = EXCLUDED.media_json, link_url = EXCLUDED.link_url, "
            "link_title = EXCLUDED.link_title, "
            "link_description = EXCLUDED.link_description, "
            "link_image = EXCLUDED.link_image, "
            "link_site_name = EXCLUDED.link_site_name, "
            "view_count = EXCLUDED.view_count, "
            "like_count = EXCLUDED.like_count, "
            "comment_count = EXCLUDED.comment_count, "
            "share_count = EXCLUDED.share_count, "
            "save_count = EXCLUDED.save_count, "
            "engagement_rate = EXCLUDED.engagement_rate, "
            "last_comment_at = EXCLUDED.last_comment_at, "
            "deleted_at = EXCLUDED.deleted_at, "
            "published_at = EXCLUDED.published_at, "
            "updated_at = EXCLUDED.updated_at, "
            "event_id = EXCLUDED.event_id, "
            "event_timestamp = EXCLUDED.event_timestamp"),
        p);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostDAL",
                  "upsertPost " + row.postId + " failed: " + e.what());
    throw;
  }
}

void PostDAL::softDeletePost(const std::string &postId,
                             const EventBookkeeping &event) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(postId);
    appendBookkeeping(p, event);

    auto result = txn.exec(
        pqxx::zview("UPDATE analytics.posts SET "
                    "deleted_at = COALESCE(deleted_at, $3::timestamptz, NOW()), "
                    "event_id = $2, event_timestamp = $3::timestamptz "
                    "WHERE post_id = $1"),
        p);
    txn.commit();

    if (result.affected_rows() == 0) {
      Logger::warning(LogCategory::DATABASE, "PostDAL",
                      "softDeletePost: no row for " + postId);
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostDAL",
                  "softDeletePost " + postId + " failed: " + e.what());
    throw;
  }
}

std::optional<PostRow> PostDAL::findPost(const std::string &postId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(postId);
  const std::string sql =
      "SELECT post_id, post_type, author_user_id, author_display_name, "
      "author_avatar, author_type, text_content, media_json::text, link_url, "
      "link_title, link_description, link_image, link_site_name, view_count, "
      "like_count, comment_count, share_count, save_count, engagement_rate, " +
      utcColumn("last_comment_at") + ", " + utcColumn("deleted_at") + ", " +
      utcColumn("published_at") + ", " + utcColumn("created_at") + ", " +
      utcColumn("updated_at") + ", event_id, " + utcColumn("event_timestamp") +
      " FROM analytics.posts WHERE post_id = $1";
  auto result = txn.exec(pqxx::zview(sql), p);
  if (result.empty())
    return std::nullopt;

  const auto &r = result[0];
  PostRow row;
  row.postId = r[0].as<std::string>();
  row.postType = r[1].as<std::string>();
  row.authorUserId = r[2].as<std::string>();
  row.authorDisplayName = readText(r[3]);
  row.authorAvatar = readText(r[4]);
  row.authorType = readText(r[5]);
  row.textContent = readText(r[6]);
  row.mediaJson = readText(r[7]);
  row.linkUrl = readText(r[8]);
  row.linkTitle = readText(r[9]);
  row.linkDescription = readText(r[10]);
  row.linkImage = readText(r[11]);
  row.linkSiteName = readText(r[12]);
  row.viewCount = readInt(r[13]).value_or(0);
  row.likeCount = readInt(r[14]).value_or(0);
  row.commentCount = readInt(r[15]).value_or(0);
  row.shareCount = readInt(r[16]).value_or(0);
  row.saveCount = readInt(r[17]).value_or(0);
  row.engagementRate = readDouble(r[18]).value_or(0.0);
  row.lastCommentAt = readTimestamp(r[19]);
  row.deletedAt = readTimestamp(r[20]);
  row.publishedAt = readTimestamp(r[21]);
  row.createdAt = readRequiredTimestamp(r[22]);
  row.updatedAt = readRequiredTimestamp(r[23]);
  row.event.eventId = readText(r[24]);
  row.event.eventTimestamp = readTimestamp(r[25]);
  return row;
}

size_t PostDAL::countActivePosts() {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());
  auto result = txn.exec("SELECT COUNT(*) FROM analytics.active_posts");
  return result[0][0].as<size_t>();
}

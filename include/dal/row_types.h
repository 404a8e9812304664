#ifndef ROW_TYPES_H
#define ROW_TYPES_H

#include "utils/time_utils.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using OptionalText = std::optional<std::string>;
using OptionalInt = std::optional<int64_t>;
using OptionalDouble = std::optional<double>;
using TimeUtils::OptionalTimestamp;
using TimeUtils::Timestamp;

// Which event last wrote a row.
struct EventBookkeeping {
  OptionalText eventId;
  OptionalTimestamp eventTimestamp;
};

struct UserRow {
  std::string userId;
  std::string email;
  OptionalText phone;
  std::string displayName;
  OptionalText avatar;
  OptionalText bio;
  int64_t version = 1;
  OptionalTimestamp deletedAt;
  Timestamp createdAt;
  Timestamp updatedAt;
  EventBookkeeping event;
};

struct SupplierRow {
  std::string supplierId;
  std::string email;
  std::string primaryPhone;
  OptionalText contactPersonName;
  OptionalText contactPersonTitle;
  OptionalText contactPersonEmail;
  OptionalText contactPersonPhone;
  std::string legalName;
  OptionalText dbaName;
  OptionalText streetAddress1;
  OptionalText streetAddress2;
  OptionalText city;
  OptionalText state;
  OptionalText zipCode;
  OptionalText country;
  OptionalText supportEmail;
  OptionalText supportPhone;
  OptionalText facebookUrl;
  OptionalText instagramHandle;
  OptionalText twitterHandle;
  OptionalText linkedinUrl;
  OptionalText timezone;
  Timestamp createdAt;
  Timestamp updatedAt;
  EventBookkeeping event;
};

struct ProductRow {
  std::string productId;
  std::string supplierId;
  OptionalText supplierName;
  std::string name;
  OptionalText shortDescription;
  std::string category;
  std::string unitType;
  OptionalText baseSku;
  OptionalText brand;
  int64_t basePriceCents = 0;
  std::string status;
  int64_t viewCount = 0;
  int64_t favoriteCount = 0;
  int64_t purchaseCount = 0;
  int64_t totalReviews = 0;
  OptionalTimestamp publishedAt;
  Timestamp createdAt;
  Timestamp updatedAt;
  EventBookkeeping event;
};

struct ProductVariantRow {
  std::string variantKey;
  std::string variantId;
  std::string variantName;
  OptionalText attributesJson;
  int64_t priceCents = 0;
  OptionalInt costCents;
  int64_t quantity = 0;
  OptionalDouble widthCm;
  OptionalDouble heightCm;
  OptionalDouble depthCm;
  OptionalText imageUrl;
};

struct OrderRow {
  std::string orderId;
  std::string orderNumber;
  std::string customerUserId;
  OptionalText customerDisplayName;
  OptionalText customerEmail;
  OptionalText customerPhone;
  OptionalText shippingRecipientName;
  OptionalText shippingPhone;
  OptionalText shippingStreet1;
  OptionalText shippingStreet2;
  OptionalText shippingCity;
  OptionalText shippingState;
  OptionalText shippingZipCode;
  OptionalText shippingCountry;
  std::string status;
  Timestamp createdAt;
  Timestamp updatedAt;
  EventBookkeeping event;
};

// product_* and supplier_* fields are the snapshot taken when the order was
// placed; later product edits never touch them.
struct OrderItemRow {
  std::string itemId;
  std::string productId;
  std::string supplierId;
  OptionalText productName;
  OptionalText variantName;
  OptionalText variantAttributesJson;
  OptionalText imageUrl;
  OptionalText supplierName;
  int64_t quantity = 0;
  int64_t unitPriceCents = 0;
  int64_t finalPriceCents = 0;
  int64_t totalCents = 0;
  std::string fulfillmentStatus{"pending"};
  int64_t shippedQuantity = 0;
  OptionalText trackingNumber;
  OptionalText carrier;
  OptionalTimestamp shippedAt;
  OptionalTimestamp deliveredAt;
};

struct PostRow {
  std::string postId;
  std::string postType;
  std::string authorUserId;
  OptionalText authorDisplayName;
  OptionalText authorAvatar;
  OptionalText authorType;
  OptionalText textContent;
  OptionalText mediaJson;
  OptionalText linkUrl;
  OptionalText linkTitle;
  OptionalText linkDescription;
  OptionalText linkImage;
  OptionalText linkSiteName;
  int64_t viewCount = 0;
  int64_t likeCount = 0;
  int64_t commentCount = 0;
  int64_t shareCount = 0;
  int64_t saveCount = 0;
  double engagementRate = 0.0;
  OptionalTimestamp lastCommentAt;
  OptionalTimestamp deletedAt;
  OptionalTimestamp publishedAt;
  Timestamp createdAt;
  Timestamp updatedAt;
  EventBookkeeping event;
};

#endif

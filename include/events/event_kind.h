#ifndef EVENT_KIND_H
#define EVENT_KIND_H

#include <cstdint>

enum class Domain : uint8_t { USER, SUPPLIER, PRODUCT, ORDER, POST };

// Closed set of write events the replica understands. Adding a value here
// makes every exhaustive switch over EventKind fail to compile until the new
// kind is routed and handled.
enum class EventKind : uint8_t {
  USER_CREATED,
  USER_UPDATED,
  USER_DELETED,

  SUPPLIER_CREATED,
  SUPPLIER_UPDATED,
  SUPPLIER_DELETED,

  PRODUCT_CREATED,
  PRODUCT_UPDATED,
  PRODUCT_PUBLISHED,
  PRODUCT_DISCONTINUED,
  PRODUCT_OUT_OF_STOCK,
  PRODUCT_RESTORED,
  PRODUCT_DELETED,

  ORDER_CREATED,
  ORDER_CANCELLED,

  POST_CREATED,
  POST_UPDATED,
  POST_PUBLISHED,
  POST_DELETED
};

// What the "data" object of an envelope carries for a given kind.
enum class PayloadShape : uint8_t {
  FULL_SNAPSHOT,   // complete entity document
  ENTITY_REF,      // {<domain>_id}
  ORDER_NUMBER_REF // {order_number}
};

#endif

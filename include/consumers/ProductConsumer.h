#ifndef PRODUCT_CONSUMER_H
#define PRODUCT_CONSUMER_H

#include "consumers/IDomainConsumer.h"
#include "dal/product_dal.h"
#include <vector>

struct FlattenedProduct {
  ProductRow product;
  std::vector<ProductVariantRow> variants;
  // false when the payload has no variants key; the stored set is then kept.
  bool variantsPresent = false;
};

// Every product lifecycle event carries the full document, so created,
// updated, published, discontinued, out_of_stock and restored all rewrite
// the parent row. The variant set is replaced whenever the payload carries
// it, so an explicit empty object clears it.
class ProductConsumer : public IDomainConsumer {
public:
  explicit ProductConsumer(IProductDAL &dal) : dal_(dal) {}

  Domain getDomain() const override { return Domain::PRODUCT; }
  std::map<EventKind, EventHandler> getHandlers() override;

  static FlattenedProduct flatten(const EventEnvelope &event);
  static ProductVariantRow flattenVariant(const std::string &variantKey,
                                          const json &variant);

private:
  void handleUpsert(EventKind kind, const EventEnvelope &event);
  void handleDeleted(const EventEnvelope &event);

  IProductDAL &dal_;
};

#endif

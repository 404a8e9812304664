#ifndef PRODUCT_DAL_H
#define PRODUCT_DAL_H

#include "dal/row_types.h"
#include "db/connection_pool.h"
#include <optional>
#include <string>
#include <vector>

class IProductDAL {
public:
  virtual ~IProductDAL() = default;

  virtual void upsertProduct(const ProductRow &row) = 0;

  // Deletes every variant of the product and inserts the given set, in one
  // transaction. Afterwards the stored variant keys equal exactly the keys
  // in variants.
  virtual void replaceVariants(const std::string &productId,
                               const std::vector<ProductVariantRow> &variants) = 0;

  // Removes the product; its variants go with it through the foreign key.
  virtual void deleteProduct(const std::string &productId) = 0;

  virtual std::optional<ProductRow> findProduct(const std::string &productId) = 0;
  virtual std::vector<ProductVariantRow>
  listVariants(const std::string &productId) = 0;
};

class ProductDAL : public IProductDAL {
public:
  explicit ProductDAL(ConnectionPool &pool) : pool_(pool) {}

  void upsertProduct(const ProductRow &row) override;
  void replaceVariants(const std::string &productId,
                       const std::vector<ProductVariantRow> &variants) override;
  void deleteProduct(const std::string &productId) override;
  std::optional<ProductRow> findProduct(const std::string &productId) override;
  std::vector<ProductVariantRow>
  listVariants(const std::string &productId) override;

  std::vector<std::string> listVariantKeys(const std::string &productId);

private:
  ConnectionPool &pool_;
};

#endif

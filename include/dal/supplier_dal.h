#ifndef SUPPLIER_DAL_H
#define SUPPLIER_DAL_H

#include "dal/row_types.h"
#include "db/connection_pool.h"
#include <optional>
#include <string>

class ISupplierDAL {
public:
  virtual ~ISupplierDAL() = default;

  virtual void upsertSupplier(const SupplierRow &row) = 0;
  virtual void deleteSupplier(const std::string &supplierId) = 0;
  virtual std::optional<SupplierRow>
  findSupplier(const std::string &supplierId) = 0;
};

class SupplierDAL : public ISupplierDAL {
public:
  explicit SupplierDAL(ConnectionPool &pool) : pool_(pool) {}

  void upsertSupplier(const SupplierRow &row) override;
  void deleteSupplier(const std::string &supplierId) override;
  std::optional<SupplierRow>
  findSupplier(const std::string &supplierId) override;

private:
  ConnectionPool &pool_;
};

#endif
